#include "commands/guess.hpp"
#include "commands/train.hpp"

#include <iostream>
#include <string>

static int print_usage() {
    std::cerr
        << "usage:\n"
        << "  tfidf-guesser train [args]\n"
        << "  tfidf-guesser guess [args]\n"
        << "  tfidf-guesser help\n";
    return 1;
}

static int print_train_help() {
    std::cerr
        << "usage:\n"
        << "  tfidf-guesser train --train <path> [options]\n"
        << "\n"
        << "options:\n"
        << "  --train <path>               (required) JSON array or JSON lines of questions\n"
        << "  --model <prefix>             default: models/tfidf\n"
        << "  --max_vocab <n>              default: 10000\n"
        << "  --unk_cutoff <n>             default: 2\n"
        << "  --answer_field <str>         default: page\n"
        << "  --split_sentences            train on each sentence separately\n"
        << "  --threads <n>                default: 1\n"
        << "  --verbose                    diagnostics on stderr\n";
    return 0;
}

static int print_guess_help() {
    std::cerr
        << "usage:\n"
        << "  tfidf-guesser guess --query \"<text>\" [options]\n"
        << "  tfidf-guesser guess --questions <path> [options]\n"
        << "\n"
        << "options:\n"
        << "  --model <prefix>             default: models/tfidf\n"
        << "  --answer_field <str>         default: page (with --questions; records without\n"
        << "                               one are guessed but not scored)\n"
        << "  --out <path>                 optional: mirror results to a file\n"
        << "  --verbose                    diagnostics on stderr\n";
    return 0;
}

int main(int argc, char** argv) {
    if (argc < 2) return print_usage();

    const std::string cmd = argv[1];

    if (cmd == "help") {
        return print_usage();
    }

    // subcommand help
    if (cmd == "train" && (argc >= 3 && std::string(argv[2]) == "--help")) return print_train_help();
    if (cmd == "guess" && (argc >= 3 && std::string(argv[2]) == "--help")) return print_guess_help();

    if (cmd == "train") return cmd_train(argc - 1, argv + 1);
    if (cmd == "guess") return cmd_guess(argc - 1, argv + 1);

    std::cerr << "unknown command\n";
    return print_usage();
}
