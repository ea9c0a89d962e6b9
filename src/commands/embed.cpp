#include "commands/embed.hpp"
#include "commands/CliArgs.hpp"
#include "commands/prepare.hpp"

#include "emb/EmbeddingStore.hpp"

#include <iostream>
#include <string>

int cmd_embed(int argc, char** argv) {
    const std::string input = get_arg(argc, argv, "--input", "");
    const std::string outp  = get_arg(argc, argv, "--out", "");

    if (input.empty() || outp.empty()) {
        std::cerr << "error: embed requires --input <csv> and --out <bin>\n";
        return 2;
    }

    align::AppConfig cfg;
    if (!load_effective_config(argc, argv, cfg)) return 2;

    try {
        SideInputs in;
        in.csv_path = input;
        in.translate = cfg.translation.enabled || !cfg.translation.mock_file.empty();

        PreparedSide side = prepare_side(in, cfg, "input", cfg.translation.mock_file);

        EmbeddingStore store;
        store.set_from(side.records);
        store.save(outp);

        std::cout << "INPUT: " << input << "\n";
        std::cout << "ROWS: " << side.records.size() << "\n";
        std::cout << "EMBEDDED: " << store.size() << "\n";
        std::cout << "DIM: " << store.dim() << "\n";
        std::cout << "OUT_EMB: " << outp << "\n";
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "embed failed: " << e.what() << "\n";
        return 1;
    }
}
