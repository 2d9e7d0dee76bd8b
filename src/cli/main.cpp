#include <cctype>
#include <cstdio>
#include <string>
#include <vector>

#include "ctl/ipc.hpp"
#include "util/constants.hpp"
#include "util/exitcodes.hpp"
#include "util/log.hpp"

namespace
{

enum class ArgKind
{
    None,  // no arguments
    Text,  // one or more words, joined by spaces
    OnOff  // exactly "on" or "off"
};

struct Command
{
    const char *name;
    const char *verb;  // control line keyword understood by msgstreamd
    ArgKind     args;
    const char *help;
};

constexpr Command COMMANDS[] = {
    {"send", "SEND", ArgKind::Text, "send <text...>"},
    {"sendx", "SENDX", ArgKind::Text, "sendx <text...>     (encrypted; daemon needs MSGSTREAM_KEY)"},
    {"tail", "TAIL", ArgKind::OnOff, "tail on|off"},
    {"status", "STATUS", ArgKind::None, "status"},
    {"disconnect", "DISCONNECT", ArgKind::None, "disconnect"},
    {"quit", "QUIT", ArgKind::None, "quit"},
};

void print_usage()
{
    std::fprintf(stderr, "Usage:\n"
                         "  msgstreamctl [--sock <path>] <command> [args]\n"
                         "\n"
                         "Commands:\n");
    for (const auto &c : COMMANDS)
        std::fprintf(stderr, "  %s\n", c.help);
}

const Command *find_command(const std::string &name)
{
    for (const auto &c : COMMANDS)
        if (name == c.name)
            return &c;
    return nullptr;
}

// Builds the control line for `c`; false when the arguments do not fit.
bool build_line(const Command &c, const std::vector<std::string> &args, std::string &line)
{
    line = c.verb;
    switch (c.args)
    {
        case ArgKind::None:
            return args.empty();
        case ArgKind::Text:
            if (args.empty())
                return false;
            for (const auto &a : args)
            {
                line.push_back(' ');
                line += a;
            }
            return true;
        case ArgKind::OnOff:
        {
            if (args.size() != 1)
                return false;
            std::string v = args[0];
            for (auto &ch : v)
                ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
            if (v != "on" && v != "off")
            {
                std::fprintf(stderr, "error: %s expects 'on' or 'off'\n", c.name);
                return false;
            }
            line += " " + v;
            return true;
        }
    }
    return false;
}

int send_one_line(const std::string &sock, const std::string &line)
{
    if (line.find('\n') != std::string::npos)
    {
        std::fprintf(stderr, "error: command line must not contain newline characters\n");
        return exitc::bad_args;
    }

    std::string reply;
    if (!ipc::send_line(sock, line + "\n", &reply))
    {
        std::fprintf(stderr, "error: cannot reach daemon at %s\n", sock.c_str());
        return exitc::no_server;
    }
    if (!reply.empty())
        std::fputs(reply.c_str(), stdout);
    return exitc::ok;
}

}  // namespace

int main(int argc, char **argv)
{
    // MSGSTREAM_CTL_SOCK, then --sock
    std::string sock = ipc::expand_user(constants::ctl_sock_path());

    std::vector<std::string> words;
    for (int i = 1; i < argc; ++i)
    {
        std::string a = argv[i];
        if (a == "--help" || a == "-h")
        {
            print_usage();
            return exitc::ok;
        }
        if (a == "--sock")
        {
            if (i + 1 >= argc)
            {
                std::fprintf(stderr, "error: --sock needs a path\n");
                return exitc::bad_args;
            }
            sock = ipc::expand_user(argv[++i]);
            continue;
        }
        words.push_back(std::move(a));
    }
    if (words.empty())
    {
        print_usage();
        return exitc::bad_args;
    }

    const Command *cmd = find_command(words[0]);
    if (!cmd)
    {
        std::fprintf(stderr, "Unknown command: %s\n", words[0].c_str());
        print_usage();
        return exitc::bad_args;
    }

    std::string line;
    if (!build_line(*cmd, std::vector<std::string>(words.begin() + 1, words.end()), line))
    {
        print_usage();
        return exitc::bad_args;
    }
    LOG_DEBUG("Running command: %s", cmd->name);
    return send_one_line(sock, line);
}
