#include "wire_commands.hpp"
#include "fundamentals/bytes.hpp"

#include <print>
#include <string>
#include <optional>

void print_usage(const char* prog)
{
    std::println("Usage: {} <command> [args]", prog);
    std::println("Commands:");
    std::println("  decode <hex>...                 Decode datagrams given in hex");
    std::println("  rrq <filename> <mode>           Encode a read request");
    std::println("  wrq <filename> <mode>           Encode a write request");
    std::println("  data <block> <text>             Encode a DATA datagram");
    std::println("  ack <block>                     Encode an ACK datagram");
    std::println("  error <code> [message]          Encode an ERROR datagram");
}

int emit(const std::expected<tftp::Message, std::string>& m)
{
    if (!m)
    {
        std::println(stderr, "{}", m.error());
        return 1;
    }
    std::println("{}", *m);
    std::println("{}", bytes::to_hex(tftp::serialize(*m)));
    return 0;
}

int cmd_decode(int argc, char** argv)
{
    int rc = 0;
    for (int i = 2; i < argc; ++i)
    {
        if (auto line = wire_cli::decode_hex(argv[i]); line)
        {
            std::println("{}", *line);
        }
        else
        {
            std::println(stderr, "{}", line.error());
            rc = 1;
        }
    }
    return rc;
}

int main(int argc, char** argv)
{
    if (argc < 2)
    {
        print_usage(argv[0]);
        return 1;
    }

    std::string cmd = argv[1];

    if (cmd == "decode" && argc >= 3)
    {
        return cmd_decode(argc, argv);
    }
    else if (cmd == "rrq" && argc == 4)
    {
        return emit(tftp::ReadRequest(argv[2], argv[3]));
    }
    else if (cmd == "wrq" && argc == 4)
    {
        return emit(tftp::WriteRequest(argv[2], argv[3]));
    }
    else if (cmd == "data" && argc == 4)
    {
        return emit(wire_cli::encode_block(cmd, argv[2], argv[3]));
    }
    else if (cmd == "ack" && argc == 3)
    {
        return emit(wire_cli::encode_block(cmd, argv[2], std::nullopt));
    }
    else if (cmd == "error" && (argc == 3 || argc == 4))
    {
        return emit(wire_cli::encode_error(argv[2], argc == 4 ? std::optional<std::string>(argv[3]) : std::nullopt));
    }
    else
    {
        print_usage(argv[0]);
        return 1;
    }
}
