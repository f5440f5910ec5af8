#ifndef CLI_HPP
#define CLI_HPP

// Exit codes: 0 success, 1 usage or fatal error, 2 verify found damage.
constexpr int EXIT_VERIFY_FAILED = 2;

void print_usage(const char* progName);

// Parses argv and runs one subcommand. Returns the process exit code.
int run_cli(int argc, char* argv[]);

#endif // CLI_HPP
