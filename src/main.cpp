#include "cli/cli.hpp"
#include "core/config.hpp"
#include "core/corpus.hpp"
#include "core/errors.hpp"
#include "data/chapter_loader.hpp"
#include "export/snapshot_exporter.hpp"
#include "graph/clustering.hpp"
#include "graph/word_graph.hpp"
#include "text/normalizer.hpp"
#include "text/transliterator.hpp"
#include <iomanip>
#include <iostream>
#include <string>

using namespace vg;

// ============== Helper Functions ==============

// Config file (or environment) first, then command-line overrides
CorpusConfig resolve_config(const Args& args) {
    CorpusConfig config = load_config_with_fallback(args.get("config").value);

    if (args.has("data")) config.data_path = args.get("data").value;
    if (args.has("first")) config.first_chapter = args.get("first").as_int();
    if (args.has("last")) config.last_chapter = args.get("last").as_int();
    if (args.has("verbose")) config.verbose = true;

    // A single-chapter query only needs that chapter loaded
    if (args.has("chapter") && !args.has("first") && !args.has("last")) {
        int chapter = args.get("chapter").as_int();
        config.first_chapter = chapter;
        config.last_chapter = chapter;
    }

    return config;
}

Corpus build_corpus(const CorpusConfig& config) {
    Corpus corpus(config);

    if (config.verbose) {
        corpus.set_progress_callback([](const std::string& stage, int current, int total, const std::string& msg) {
            std::cout << "  [" << stage << "] " << current << "/" << total;
            if (!msg.empty()) std::cout << " - " << msg;
            std::cout << "\r" << std::flush;
        });
    }

    std::cout << "Building corpus from: " << config.data_path
              << " (chapters " << config.first_chapter << "-" << config.last_chapter << ")\n";
    corpus.build();
    if (config.verbose) std::cout << "\n";

    return corpus;
}

void print_word(const Word& word) {
    std::cout << "  " << std::left << std::setw(10) << word.location().to_string()
              << " " << word.text()
              << "  [" << word.normalized() << "]"
              << "  " << word.transliteration() << "\n";
}

// ============== versegraph verify ==============
int cmd_verify(const Args& args) {
    CorpusConfig config = resolve_config(args);
    if (config.data_path.empty()) {
        throw ConfigError("No data path given (use --data, --config or VG_DATA_PATH)");
    }

    ChapterLoader loader(config.data_path, config.file_prefix);
    DatasetReport report = loader.verify_dataset();

    std::cout << "\nDataset: " << config.data_path << "\n";
    std::cout << "  Valid chapters:   " << report.valid_chapters << "/" << kTotalChapters << "\n";
    std::cout << "  Missing chapters: " << report.missing_chapters.size() << "\n";
    std::cout << "  Invalid chapters: " << report.invalid_chapters.size() << "\n";
    std::cout << "  Total verses:     " << report.total_verses << "\n";

    if (!report.missing_chapters.empty()) {
        std::cout << "\nMissing:";
        for (int chapter : report.missing_chapters) std::cout << " " << chapter;
        std::cout << "\n";
    }

    if (!report.invalid_chapters.empty()) {
        std::cout << "\nInvalid:\n";
        for (const auto& [chapter, reason] : report.invalid_chapters) {
            std::cout << "  " << chapter << ": " << reason << "\n";
        }
    }

    std::cout << "\n" << (report.is_complete() ? "Dataset is complete." : "Dataset is incomplete.") << "\n";
    return report.is_complete() ? 0 : 1;
}

// ============== versegraph stats ==============
int cmd_stats(const Args& args) {
    Corpus corpus = build_corpus(resolve_config(args));

    std::cout << "\nCorpus Statistics:\n";
    std::cout << "  Chapters: " << corpus.total_chapters() << "\n";
    std::cout << "  Verses:   " << corpus.total_verses() << "\n";
    std::cout << "  Words:    " << corpus.total_words() << "\n";

    std::cout << "\nWords per chapter:\n";
    for (const auto& [chapter_number, count] : corpus.word_count_by_chapter()) {
        const Chapter* chapter = corpus.find_chapter(chapter_number);
        std::cout << "  " << std::right << std::setw(3) << chapter_number << "  "
                  << std::setw(6) << count << "  " << (chapter ? chapter->name() : "?") << "\n";
    }

    return 0;
}

// ============== versegraph words ==============
int cmd_words(const Args& args) {
    Corpus corpus = build_corpus(resolve_config(args));
    bool normalized = args.has("normalized");

    WordFilter filter = corpus.filter_words();
    if (args.has("chapter")) {
        int chapter = args.get("chapter").as_int();
        filter = args.has("verse") ? filter.by_verse(chapter, args.get("verse").as_int())
                                   : filter.by_chapter(chapter);
    } else if (args.has("verse")) {
        throw FilterError("--verse requires --chapter");
    }
    if (args.has("text")) filter = filter.by_text(args.get("text").value, normalized);
    if (args.has("contains")) filter = filter.by_text_contains(args.get("contains").value, normalized);

    std::cout << "Matched " << filter.count() << " words\n";

    if (args.has("output")) {
        std::string output_path = args.get("output").value;
        SnapshotExporter exporter(corpus);
        exporter.export_filtered_words(filter.get(), output_path, "versegraph words query");
        std::cout << "Saved to: " << output_path << "\n";
        return 0;
    }

    int limit = args.get("limit", "50").as_int();
    int shown = 0;
    for (const auto& word : filter.get()) {
        if (limit > 0 && shown >= limit) {
            std::cout << "  ... " << (filter.count() - shown) << " more\n";
            break;
        }
        print_word(word);
        ++shown;
    }

    return 0;
}

// ============== versegraph graph ==============
int cmd_graph(const Args& args) {
    CorpusConfig config = resolve_config(args);
    Corpus corpus = build_corpus(config);

    WordFilter filter = corpus.filter_words();
    if (args.has("chapter")) {
        filter = filter.by_chapter(args.get("chapter").as_int());
    }

    GraphBuilder builder(RelationWeights::from_config(config));
    const WordGraph& graph = builder.build_from_words(
        filter.get(),
        !args.has("no-roots"),
        !args.has("no-lemmas"),
        !args.has("no-normalized")
    );

    auto stats = graph.compute_statistics();

    std::cout << "\nWord Graph Statistics:\n";
    std::cout << "  Nodes: " << stats.num_nodes << "\n";
    std::cout << "  Edges: " << stats.num_edges << "\n";
    std::cout << "  Avg degree: " << stats.avg_degree << "\n";
    std::cout << "  Max degree: " << stats.max_degree << "\n";
    for (const auto& [kind, count] : stats.edges_by_kind) {
        std::cout << "  " << kind << " edges: " << count << "\n";
    }

    auto components = cluster_by_connectivity(graph);
    auto cluster_stats = compute_cluster_statistics(components);
    std::cout << "  Connected clusters: " << cluster_stats.num_clusters
              << " (largest " << cluster_stats.max_cluster_size << ")\n";

    auto hubs = graph.top_hubs(10);
    std::cout << "\nTop " << hubs.size() << " Hubs:\n";
    for (const auto& [word, degree] : hubs) {
        std::cout << "  " << word.text() << " @ " << word.location().to_string()
                  << " (degree " << degree << ")\n";
    }

    if (args.has("output")) {
        std::string output_path = args.get("output").value;
        graph.export_to_json(output_path);
        std::cout << "\nSaved graph to: " << output_path << "\n";
    }

    return 0;
}

// ============== versegraph export ==============
int cmd_export(const Args& args) {
    std::string output_path = args.require("output");
    Corpus corpus = build_corpus(resolve_config(args));
    SnapshotExporter exporter(corpus);

    if (args.has("chapter")) {
        int chapter = args.get("chapter").as_int();
        exporter.export_chapter_summary(chapter, output_path);
        std::cout << "Exported chapter " << chapter << " summary to: " << output_path << "\n";
    } else {
        exporter.export_full_snapshot(output_path, args.has("all-words"));
        std::cout << "Exported snapshot to: " << output_path << "\n";
    }

    return 0;
}

// ============== versegraph normalize ==============
int cmd_normalize(const Args& args) {
    std::string text = args.require("text");
    std::cout << Normalizer::normalize(text) << "\n";
    return 0;
}

// ============== versegraph transliterate ==============
int cmd_transliterate(const Args& args) {
    std::string text = args.require("text");
    if (args.has("reverse")) {
        std::cout << Transliterator::to_source(text) << "\n";
    } else {
        std::cout << Transliterator::to_transliteration(text) << "\n";
    }
    return 0;
}

int main(int argc, char** argv) {
    CLI cli("versegraph", "1.0.0");

    const ArgDef data_arg{"data", "d", "Directory holding the chapter JSON files", "", false, false};
    const ArgDef config_arg{"config", "c", "Corpus config JSON file", "", false, false};
    const ArgDef verbose_arg{"verbose", "V", "Print progress while loading", "", false, true};

    cli.register_command({
        "verify",
        "Audit a dataset directory for missing or invalid chapters",
        {data_arg, config_arg},
        cmd_verify
    });

    cli.register_command({
        "stats",
        "Print chapter, verse and word counts",
        {
            data_arg, config_arg, verbose_arg,
            {"first", "f", "First chapter to load", "", false, false},
            {"last", "l", "Last chapter to load", "", false, false}
        },
        cmd_stats
    });

    cli.register_command({
        "words",
        "List or export words matching filters",
        {
            data_arg, config_arg, verbose_arg,
            {"chapter", "n", "Chapter number", "", false, false},
            {"verse", "a", "Verse number (requires --chapter)", "", false, false},
            {"text", "t", "Exact word text", "", false, false},
            {"contains", "s", "Substring of the word text", "", false, false},
            {"normalized", "N", "Match against normalized text", "", false, true},
            {"limit", "m", "Maximum words to print (0 for all)", "50", false, false},
            {"output", "o", "Export matches to a JSON file", "", false, false}
        },
        cmd_words
    });

    cli.register_command({
        "graph",
        "Build a word relation graph and print its statistics",
        {
            data_arg, config_arg, verbose_arg,
            {"chapter", "n", "Restrict the graph to one chapter", "", false, false},
            {"no-roots", "", "Skip shared-root relations", "", false, true},
            {"no-lemmas", "", "Skip shared-lemma relations", "", false, true},
            {"no-normalized", "", "Skip identical-normalized relations", "", false, true},
            {"output", "o", "Export the graph to a JSON file", "", false, false}
        },
        cmd_graph
    });

    cli.register_command({
        "export",
        "Export a corpus snapshot or a chapter summary",
        {
            data_arg, config_arg, verbose_arg,
            {"output", "o", "Output JSON file", "", true, false},
            {"all-words", "w", "Include every word in the snapshot", "", false, true},
            {"chapter", "n", "Export a single chapter summary instead", "", false, false}
        },
        cmd_export
    });

    cli.register_command({
        "normalize",
        "Normalize a piece of text",
        {
            {"text", "t", "Text to normalize", "", true, false}
        },
        cmd_normalize
    });

    cli.register_command({
        "transliterate",
        "Transliterate text to ASCII, or back with --reverse",
        {
            {"text", "t", "Text to transliterate", "", true, false},
            {"reverse", "r", "Map ASCII transliteration back to the source script", "", false, true}
        },
        cmd_transliterate
    });

    return cli.run(argc, argv);
}
