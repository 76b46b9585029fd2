/**
 * Hybrid recipe search example using Saffron
 *
 * This example demonstrates:
 * - Loading recipes into a document store
 * - Building the BM25 index and the in-process vector backend
 * - Sparse, dense and hybrid search side by side
 * - Metadata filters (difficulty, total time, dietary restrictions)
 *
 * Usage:
 *   recipe_search [--difficulty D] [--max-time MIN] [--diet TAG]... [--limit N] query...
 */

#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "saffron/config.hpp"
#include "saffron/filter/recipe_filter.hpp"
#include "saffron/index/sparse_index.hpp"
#include "saffron/log.hpp"
#include "saffron/recipe.hpp"
#include "saffron/search/dense_retriever.hpp"
#include "saffron/search/embedding_backend.hpp"
#include "saffron/search/hybrid_searcher.hpp"
#include "saffron/store/document_store.hpp"

using namespace saffron;

namespace {

Document make_recipe(std::string id, std::string title, Difficulty difficulty,
                     std::int64_t prep, std::int64_t cook, std::int64_t servings,
                     std::vector<std::string> ingredients,
                     std::vector<std::string> instructions) {
    Document doc;
    doc.id = std::move(id);
    doc.metadata.title = std::move(title);
    doc.metadata.difficulty = difficulty;
    doc.metadata.prep_time_minutes = prep;
    doc.metadata.cook_time_minutes = cook;
    doc.metadata.servings = servings;
    doc.metadata.ingredients = std::move(ingredients);
    doc.metadata.instructions = std::move(instructions);
    return doc;
}

std::vector<Document> sample_recipes() {
    return {
        make_recipe("recipe-001", "Chicken Fried Rice", Difficulty::Beginner, 15, 15, 4,
                    {"2 cups cooked rice", "1 chicken breast, diced", "2 eggs", "soy sauce", "peas"},
                    {"Scramble the eggs.", "Fry the chicken until golden.", "Add rice, peas and soy sauce."}),
        make_recipe("recipe-002", "Vegetable Curry", Difficulty::Intermediate, 20, 35, 4,
                    {"potatoes", "cauliflower", "coconut milk", "curry paste", "onion"},
                    {"Fry the onion with curry paste.", "Simmer vegetables in coconut milk."}),
        make_recipe("recipe-003", "Chicken Curry", Difficulty::Intermediate, 20, 40, 6,
                    {"chicken thighs", "curry powder", "tomatoes", "yogurt", "garlic"},
                    {"Brown the chicken.", "Simmer with tomatoes, yogurt and curry powder."}),
        make_recipe("recipe-004", "Classic Pancakes", Difficulty::Beginner, 10, 15, 4,
                    {"flour", "milk", "eggs", "butter", "sugar", "baking powder"},
                    {"Whisk the batter.", "Cook on a hot griddle until bubbles form."}),
        make_recipe("recipe-005", "Beef Wellington", Difficulty::Advanced, 60, 45, 6,
                    {"beef tenderloin", "puff pastry", "mushrooms", "prosciutto", "egg yolk"},
                    {"Sear the beef.", "Wrap in duxelles, prosciutto and pastry.", "Bake until golden."}),
        make_recipe("recipe-006", "Lentil Soup", Difficulty::Beginner, 10, 30, 6,
                    {"red lentils", "carrots", "celery", "vegetable stock", "cumin"},
                    {"Sweat the vegetables.", "Simmer lentils in stock until soft."}),
        make_recipe("recipe-007", "Gluten-Free Banana Bread", Difficulty::Intermediate, 15, 60, 8,
                    {"ripe bananas", "almond flour", "eggs", "honey", "baking soda"},
                    {"Mash the bananas.", "Fold in the dry ingredients.", "Bake for an hour."}),
        make_recipe("recipe-008", "Chickpea Salad", Difficulty::Beginner, 15, 0, 2,
                    {"chickpeas", "cucumber", "tomatoes", "red onion", "olive oil", "lemon"},
                    {"Chop the vegetables.", "Toss everything with olive oil and lemon."}),
    };
}

void print_usage(const char* argv0) {
    std::cerr << "Usage: " << argv0
              << " [--difficulty beginner|intermediate|advanced] [--max-time MIN]"
                 " [--diet TAG]... [--limit N] query...\n";
}

void print_metadata(const std::optional<RecipeMetadata>& m) {
    if (!m) return;
    std::cout << "  " << m->title;
    if (m->difficulty) std::cout << " [" << to_string(*m->difficulty) << "]";
    if (auto total = m->total_time_minutes()) std::cout << " " << *total << " min";
}

} // namespace

int main(int argc, char** argv) {
    auto config = SearchConfig::from_env();
    if (!config) {
        std::cerr << "Invalid configuration: " << config.error().message << std::endl;
        return 2;
    }
    saffron::log::set_level(config->log_level);

    filter::RecipeFilterSpec spec;
    int limit = static_cast<int>(config->default_search_limit);
    std::string query;

    for (int i = 1; i < argc; ++i) {
        std::string arg(argv[i]);
        if (arg == "--difficulty" && i + 1 < argc) {
            spec.difficulty = argv[++i];
        } else if (arg == "--max-time" && i + 1 < argc) {
            auto v = parse_metadata_int(argv[++i]);
            if (!v) { print_usage(argv[0]); return 2; }
            spec.max_total_time = *v;
        } else if (arg == "--diet" && i + 1 < argc) {
            spec.dietary_restrictions.emplace_back(argv[++i]);
        } else if (arg == "--limit" && i + 1 < argc) {
            auto v = parse_metadata_int(argv[++i]);
            if (!v) { print_usage(argv[0]); return 2; }
            limit = static_cast<int>(*v);
        } else if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        } else {
            if (!query.empty()) query += ' ';
            query += arg;
        }
    }
    if (query.empty()) {
        query = "chicken curry";
    }

    auto filter = filter::RecipeFilter::create(spec, config->filter_limits);
    if (!filter) {
        std::cerr << "Invalid filter: " << filter.error().message << std::endl;
        return 2;
    }

    auto store = std::make_shared<store::InMemoryDocumentStore>(sample_recipes());

    auto sparse = std::make_shared<index::SparseIndex>(config->tokenizer, config->bm25);
    if (auto built = sparse->rebuild_from(*store); !built) {
        std::cerr << "Index build failed: " << built.error().message << std::endl;
        return 1;
    }
    const auto index_stats = sparse->stats();
    std::cout << "Indexed " << index_stats.bm25.num_documents << " recipes ("
              << index_stats.bm25.vocabulary_size << " terms, avg "
              << index_stats.bm25.avg_doc_length << " keywords per recipe)\n";

    auto backend = std::make_shared<search::EmbeddingVectorBackend>(
        std::make_shared<search::HashingEmbedder>());
    auto documents = store->get_all_documents();
    if (!documents) {
        std::cerr << "Store read failed: " << documents.error().message << std::endl;
        return 1;
    }
    if (auto embedded = backend->upsert_all(*documents); !embedded) {
        std::cerr << "Embedding failed: " << embedded.error().message << std::endl;
        return 1;
    }

    search::HybridSearcher searcher(*config, sparse,
                                    std::make_shared<search::DenseRetriever>(backend), store);

    std::cout << "Query: \"" << query << "\"";
    if (filter->has_filters()) std::cout << "  filter: " << filter->describe();
    std::cout << "\n" << std::fixed << std::setprecision(4);

    std::cout << "\nSparse (BM25):\n";
    if (auto hits = searcher.sparse_search(query, limit, &*filter); hits) {
        for (const auto& h : *hits) {
            std::cout << "  " << h.id << "  score=" << h.score << "\n";
        }
    } else {
        std::cerr << "  sparse search failed: " << hits.error().message << "\n";
    }

    std::cout << "\nDense (" << backend->name() << "):\n";
    if (auto hits = searcher.dense_search(query, limit, &*filter); hits) {
        for (const auto& h : *hits) {
            std::cout << "  " << h.id << "  similarity=" << h.similarity << "\n";
        }
    } else {
        std::cerr << "  dense search failed: " << hits.error().message << "\n";
    }

    std::cout << "\nHybrid (RRF k=" << config->rrf_k << "):\n";
    auto results = searcher.hybrid_search(query, limit, &*filter);
    if (!results) {
        std::cerr << "Hybrid search failed: " << results.error().message << std::endl;
        return 1;
    }
    for (const auto& r : *results) {
        std::cout << "  " << r.id << "  combined=" << r.combined_score
                  << " (sparse #" << r.sparse_rank << ", dense #" << r.dense_rank << ")";
        print_metadata(r.metadata);
        std::cout << "\n";
    }
    return 0;
}
