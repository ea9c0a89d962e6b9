#pragma once
#include <string>

// Flag lookup shared by the subcommands. argv[0] is the subcommand name.
bool has_flag(int argc, char** argv, const std::string& key);
std::string get_arg(int argc, char** argv, const std::string& key, const std::string& def);

// Leave `out` untouched when the flag is absent. Return false (and print an
// error) when the value does not parse.
bool read_arg_double(int argc, char** argv, const std::string& key, double& out);
bool read_arg_int(int argc, char** argv, const std::string& key, int& out);
