#include "core/corpus.hpp"
#include "core/errors.hpp"
#include "export/snapshot_exporter.hpp"
#include "graph/clustering.hpp"
#include "graph/word_graph.hpp"
#include "text/normalizer.hpp"
#include "text/transliterator.hpp"
#include <iostream>
#include <string>

using namespace vg;

void print_separator(const std::string& title) {
    std::cout << "\n" << std::string(60, '=') << "\n";
    std::cout << title << "\n";
    std::cout << std::string(60, '=') << "\n\n";
}

// Annotated words built by hand, since the corpus leaves root/lemma absent
std::vector<Word> annotated_words() {
    auto make = [](int verse, int position, const std::string& text,
                   std::optional<std::string> root, std::optional<std::string> lemma) {
        return Word(1, verse, position, text, Normalizer::normalize(text),
                    Transliterator::to_transliteration(text), std::move(root), std::move(lemma));
    };

    return {
        make(1, 0, "بِسْمِ", std::string("سمو"), std::string("اسْم")),
        make(1, 1, "اللَّهِ", std::string("أله"), std::string("اللَّه")),
        make(1, 2, "الرَّحْمَٰنِ", std::string("رحم"), std::string("رَحْمَٰن")),
        make(1, 3, "الرَّحِيمِ", std::string("رحم"), std::string("رَحِيم")),
        make(2, 0, "الْحَمْدُ", std::string("حمد"), std::string("حَمْد")),
        make(2, 1, "لِلَّهِ", std::string("أله"), std::string("اللَّه")),
        make(3, 0, "الرَّحْمَٰنِ", std::string("رحم"), std::string("رَحْمَٰن")),
        make(3, 1, "الرَّحِيمِ", std::string("رحم"), std::string("رَحِيم"))
    };
}

int main(int argc, char** argv) {
    print_separator("Word Graph Example - Relations Between Words");

    auto words = annotated_words();

    std::cout << "Words:\n";
    for (const auto& word : words) {
        std::cout << "  " << word.to_string() << "\n";
    }

    RelationBuilder relations;
    relations.build_root_relations(words);
    relations.build_lemma_relations(words);
    relations.build_normalized_relations(words);

    std::cout << "\nRelations (" << relations.count() << "):\n";
    for (const auto& relation : relations.get_all()) {
        std::cout << "  " << relation.to_string() << "\n";
    }

    GraphBuilder builder;
    const WordGraph& graph = builder.build_from_relations(relations.get_all());

    print_separator("Graph Statistics");
    std::cout << graph.compute_statistics().to_json().dump(2) << "\n";

    std::cout << "\nTop hubs:\n";
    for (const auto& [word, degree] : graph.top_hubs(3)) {
        std::cout << "  " << word.text() << " (degree " << degree << ")\n";
    }

    std::cout << "\nRoot clusters:\n";
    for (const auto& [root, members] : cluster_by_root(words)) {
        std::cout << "  " << root << ": " << members.size() << " words\n";
    }

    auto components = cluster_by_connectivity(graph);
    std::cout << "\nConnected clusters: "
              << compute_cluster_statistics(components).to_json().dump() << "\n";

    // Optional: build a real corpus from a dataset directory
    if (argc > 1) {
        print_separator("Corpus");

        try {
            CorpusConfig config;
            config.data_path = argv[1];
            config.last_chapter = 1;
            config.verbose = true;

            Corpus corpus(config);
            corpus.build();
            std::cout << corpus.to_string() << "\n";

            auto first_verse = corpus.filter_words().by_verse(1, 1).get();
            std::cout << "\nChapter 1, verse 1:\n";
            for (const auto& word : first_verse) {
                std::cout << "  " << word.to_string() << "\n";
            }

            SnapshotExporter exporter(corpus);
            exporter.export_chapter_summary(1, "output_json/chapter_1.json");
            std::cout << "\nSaved chapter summary to: output_json/chapter_1.json\n";
        } catch (const std::exception& e) {
            std::cerr << "Error: " << describe_exception(e) << "\n";
            return 1;
        }
    }

    print_separator("Example Complete");
    return 0;
}
