#pragma once
#include <map>
#include <string>
#include <vector>

#include "align/Errors.hpp"
#include "align/Models.hpp"
#include "io/Config.hpp"

// Settings every data command reads the same way: config file, then flag
// overrides. Returns false after printing the problem (usage error).
bool load_effective_config(int argc, char** argv, align::AppConfig& cfg);

struct SideInputs {
    std::string csv_path;
    std::string store_path;   // optional precomputed embeddings
    bool translate = false;
};

struct PreparedSide {
    std::vector<align::ContentRecord> records;           // text the engine sees, embeddings attached
    std::vector<align::ContentRecord> original_records;  // as read from the CSV
    std::map<int, std::string> translations;             // original_index -> translated text
};

// read CSV -> row limit -> translate -> clean -> embeddings (store or model).
// Throws std::runtime_error on I/O and collaborator setup failures.
PreparedSide prepare_side(const SideInputs& in, const align::AppConfig& cfg, const std::string& label,
                          const std::string& translate_mock);

// "<command> failed: [code] message" plus details/suggested action on stderr.
void report_failure(const std::string& command, const align::ErrorInfo& err);
