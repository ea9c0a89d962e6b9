#include "commands/align.hpp"
#include "commands/embed.hpp"
#include "commands/lines.hpp"

#include <iostream>
#include <string>

static int print_usage(int code) {
    std::cerr
        << "usage:\n"
        << "  content-align embed --input <csv> --out <bin> [options]\n"
        << "  content-align align --reference <csv> --target <csv> [options]\n"
        << "  content-align lines --reference <csv> --target <csv> [options]\n"
        << "  content-align help\n"
        << "\n"
        << "run `content-align <command> --help` for command options\n";
    return code;
}

static void print_common_help() {
    std::cerr
        << "config:\n"
        << "  --config <path>              default: content-align.json when present\n"
        << "  --row_limit <n>              only the first n rows of each CSV (0 = all)\n"
        << "\n"
        << "embedding:\n"
        << "  --model <path>               default: models/emb/model.onnx\n"
        << "  --vocab <path>               default: models/emb/vocab.txt\n"
        << "  --max_len <n>                max tokens per text, default: 256\n"
        << "\n"
        << "translation (target side / embed input):\n"
        << "  --translate                  translate through a local ollama server\n"
        << "  --source_lang <code>         default: auto-detect\n"
        << "  --target_lang <code>         default: en\n"
        << "  --llm_model <str>            default: llama3.1:8b\n"
        << "  --llm_cache <dir>            default: out/translate_cache\n"
        << "  --translate_mock <json>      canned translations by ContentId (no ollama)\n";
}

static int print_embed_help() {
    std::cerr
        << "usage:\n"
        << "  content-align embed --input <csv> --out <bin> [options]\n"
        << "\n";
    print_common_help();
    return 0;
}

static int print_align_help() {
    std::cerr
        << "usage:\n"
        << "  content-align align --reference <csv> --target <csv> [options]\n"
        << "\n"
        << "matching:\n"
        << "  --threshold <f>              default: 0.5, within [0, 1]\n"
        << "  --ref_emb <bin>              precomputed reference embeddings (from embed)\n"
        << "  --target_emb <bin>           precomputed target embeddings (from embed)\n"
        << "\n"
        << "output:\n"
        << "  --out <csv>                  default: out/aligned.csv\n"
        << "  --json <path>                optional: alignment artifact\n"
        << "  --reordered <csv>            optional: target rows in reference order\n"
        << "  --no_placeholder             leave gaps empty in --reordered\n"
        << "  --report <path>              optional: validation report JSON\n"
        << "  --quiet                      no per-row console table\n"
        << "\n";
    print_common_help();
    return 0;
}

static int print_lines_help() {
    std::cerr
        << "usage:\n"
        << "  content-align lines --reference <csv> --target <csv> [options]\n"
        << "\n"
        << "matching:\n"
        << "  --threshold <f>              default: 0.5, within [0, 1]\n"
        << "  --ref_emb <bin>              precomputed reference embeddings (from embed)\n"
        << "  --target_emb <bin>           precomputed target embeddings (from embed)\n"
        << "\n"
        << "output:\n"
        << "  --out <csv>                  default: out/line_by_line.csv\n"
        << "  --json <path>                optional: diagnostics artifact\n"
        << "  --quiet                      no per-row console table\n"
        << "\n";
    print_common_help();
    return 0;
}

int main(int argc, char** argv) {
    if (argc < 2) return print_usage(2);

    const std::string cmd = argv[1];

    if (cmd == "help" || cmd == "--help" || cmd == "-h") {
        return print_usage(0);
    }

    const bool wants_help = (argc >= 3 && std::string(argv[2]) == "--help");

    // subcommand help
    if (cmd == "embed" && wants_help) return print_embed_help();
    if (cmd == "align" && wants_help) return print_align_help();
    if (cmd == "lines" && wants_help) return print_lines_help();

    if (cmd == "embed") return cmd_embed(argc - 1, argv + 1);
    if (cmd == "align") return cmd_align(argc - 1, argv + 1);
    if (cmd == "lines") return cmd_lines(argc - 1, argv + 1);

    std::cerr << "unknown command: " << cmd << "\n";
    return print_usage(2);
}
