#include "commands/CliArgs.hpp"

#include <iostream>
#include <stdexcept>

bool has_flag(int argc, char** argv, const std::string& key) {
    for (int i = 0; i < argc; ++i) {
        if (std::string(argv[i]) == key) return true;
    }
    return false;
}

std::string get_arg(int argc, char** argv, const std::string& key, const std::string& def) {
    for (int i = 0; i + 1 < argc; ++i) {
        if (std::string(argv[i]) == key) return std::string(argv[i + 1]);
    }
    return def;
}

bool read_arg_double(int argc, char** argv, const std::string& key, double& out) {
    const std::string s = get_arg(argc, argv, key, "");
    if (s.empty()) return true;
    try {
        size_t pos = 0;
        double v = std::stod(s, &pos);
        if (pos != s.size()) throw std::invalid_argument(s);
        out = v;
        return true;
    } catch (const std::exception&) {
        std::cerr << "error: " << key << " expects a number, got '" << s << "'\n";
        return false;
    }
}

bool read_arg_int(int argc, char** argv, const std::string& key, int& out) {
    const std::string s = get_arg(argc, argv, key, "");
    if (s.empty()) return true;
    try {
        size_t pos = 0;
        int v = std::stoi(s, &pos);
        if (pos != s.size()) throw std::invalid_argument(s);
        out = v;
        return true;
    } catch (const std::exception&) {
        std::cerr << "error: " << key << " expects an integer, got '" << s << "'\n";
        return false;
    }
}
