/**
 * @file main.cpp
 * @brief Dedup demo application
 * @copyright Dedup record linkage toolkit
 *
 * Without arguments, runs the built-in demos:
 * - A small contact list resolved with a custom comparator
 * - Synthetic benchmark with blocking quality and pairwise metrics
 * - JSON save/load of a preset configuration
 *
 * With arguments `dedup_demo config.json records.json`, resolves the given
 * records and prints the clusters as JSON.
 */

#include <iomanip>
#include <iostream>
#include <random>
#include <string>
#include <vector>

#include "dedup/Dedup.hpp"

using namespace dedup;

/**
 * @brief Generate noisy copies of synthetic people
 *
 * @param entities Number of distinct people
 * @param copies Records per person
 * @param trueLabels Receives the person index of each record
 */
RecordList generateRecords(int entities, int copies, std::vector<int>& trueLabels) {
    static const std::vector<std::string> firstNames = {
        "john", "mary", "peter", "susan", "robert", "linda", "james", "karen",
        "david", "nancy", "thomas", "lisa", "daniel", "sarah", "mark", "emma"};
    static const std::vector<std::string> lastNames = {
        "smith", "jones", "taylor", "brown", "wilson", "evans", "thomas", "johnson",
        "roberts", "walker", "wright", "robinson", "thompson", "white", "hughes", "edwards"};

    std::mt19937 rng(42);
    std::uniform_int_distribution<size_t> pickFirst(0, firstNames.size() - 1);
    std::uniform_int_distribution<size_t> pickLast(0, lastNames.size() - 1);
    std::uniform_int_distribution<int> pickDigit(0, 9);
    std::uniform_real_distribution<double> uniform(0.0, 1.0);

    RecordList records;
    trueLabels.clear();

    for (int e = 0; e < entities; ++e) {
        std::string name = firstNames[pickFirst(rng)] + " " + lastNames[pickLast(rng)];
        std::string phone;
        for (int d = 0; d < 10; ++d) {
            phone += static_cast<char>('0' + pickDigit(rng));
        }

        for (int c = 0; c < copies; ++c) {
            std::string noisyName = name;
            // Typo: swap two adjacent characters
            if (c > 0 && uniform(rng) < 0.5 && noisyName.size() > 3) {
                size_t pos = 1 + static_cast<size_t>(uniform(rng) * (noisyName.size() - 3));
                std::swap(noisyName[pos], noisyName[pos + 1]);
            }
            std::string noisyPhone = phone;
            if (c > 0 && uniform(rng) < 0.3) {
                noisyPhone = phone.substr(0, 3) + "-" + phone.substr(3, 3) + "-" + phone.substr(6);
            }

            records.push_back(Record{{"name", Value(noisyName)}, {"phone", Value(noisyPhone)}});
            trueLabels.push_back(e);
        }
    }

    return records;
}

/**
 * @brief Print a cluster as "id: name, name"
 */
void printCluster(const ResolvedCluster& cluster) {
    std::cout << "  Cluster " << cluster.clusterId << ":";
    for (const auto& record : cluster.members) {
        const Value* name = record.get("name");
        std::cout << " [" << record.getId() << "] " << (name ? name->toString() : "?");
    }
    std::cout << std::endl;
}

/**
 * @brief Demo 1: Small contact list with a custom comparator
 */
void demoContacts() {
    std::cout << "\n=== Demo 1: Contact List ===" << std::endl;

    RecordList records = {
        Record{{"name", "Jon"}, {"phone", "555"}},
        Record{{"name", "John"}, {"phone", "555"}},
        Record{{"name", "Amy"}, {"phone", "777"}},
    };

    DeduplicatorConfig config;
    config.comparators.emplace_back("name", [](const Value& a, const Value& b) {
        if (a == b) return 1.0;
        std::string x = a.toString();
        std::string y = b.toString();
        bool jonJohn = (x == "Jon" && y == "John") || (x == "John" && y == "Jon");
        return jonJohn ? 0.9 : 0.0;
    });
    config.blockingAttributes = {"phone"};
    config.clusteringParams.eps = 0.3;
    config.clusteringParams.minSamples = 2;
    config.similarityThreshold = 0.7;

    Deduplicator deduplicator(config);
    ClusterSequence clusters = deduplicator(records);

    std::cout << "Found " << clusters.size() << " cluster(s):" << std::endl;
    for (const auto& cluster : clusters) {
        printCluster(cluster);
    }

    // Raising the threshold above the pair's score suppresses the link
    RunOptions strict;
    strict.similarityThreshold = 0.95;
    std::cout << "With threshold 0.95: " << deduplicator(records, strict).size()
              << " cluster(s)" << std::endl;
}

/**
 * @brief Demo 2: Synthetic benchmark with evaluation
 */
void demoBenchmark() {
    std::cout << "\n=== Demo 2: Synthetic Benchmark ===" << std::endl;

    std::vector<int> trueLabels;
    RecordList records = generateRecords(200, 3, trueLabels);

    DeduplicatorConfig config = DeduplicatorConfig::contactDirectory();
    config.numThreads = 4;
    Deduplicator deduplicator(config);

    BlockList blocks = deduplicator.buildSubBlocks(records);
    uint64_t before = Metrics::maxPossibleComparisons(records.size());
    uint64_t after = Metrics::comparisonsInBlocks(blocks);

    ClusterSequence clusters = deduplicator(records);
    std::vector<int> predLabels = Metrics::labelsFromClusters(clusters, records.size());

    const auto& stats = clusters.statistics();
    std::cout << std::fixed << std::setprecision(3);
    std::cout << "Records: " << stats.totalRecords << std::endl;
    std::cout << "Sub-blocks: " << stats.subBlocks << std::endl;
    std::cout << "Comparisons: " << stats.comparisons << " of " << before << std::endl;
    std::cout << "Reduction ratio: " << Metrics::reductionRatio(before, after) << std::endl;
    std::cout << "Pair completeness: " << Metrics::pairCompleteness(trueLabels, blocks) << std::endl;
    std::cout << "Clusters: " << clusters.size() << std::endl;
    std::cout << "Precision: " << Metrics::precision(trueLabels, predLabels) << std::endl;
    std::cout << "Recall: " << Metrics::recall(trueLabels, predLabels) << std::endl;
    std::cout << "F1: " << Metrics::f1Score(trueLabels, predLabels) << std::endl;
    std::cout << "Processing time: " << stats.processingTimeMs << " ms" << std::endl;
}

/**
 * @brief Demo 3: JSON configuration
 */
void demoJsonConfig() {
    std::cout << "\n=== Demo 3: JSON Configuration ===" << std::endl;

    DeduplicatorConfig config = DeduplicatorConfig::largeDataset();

    std::string jsonStr = JsonSaver::saveToString(config);
    std::cout << "Generated JSON configuration:" << std::endl;
    std::cout << jsonStr << std::endl;

    DeduplicatorConfig loadedConfig = JsonLoader::loadFromString(jsonStr);
    std::cout << "Loaded configuration:" << std::endl;
    std::cout << "  Comparators: " << loadedConfig.comparators.size() << std::endl;
    std::cout << "  Blocking rule: "
              << (loadedConfig.blockingRule ? loadedConfig.blockingRule->toString() : "none") << std::endl;
    std::cout << "  Splitter: " << loadedConfig.splitter.kind << std::endl;
    std::cout << "  Clustering: " << loadedConfig.clusteringParams.algorithm << std::endl;
    std::cout << "  Valid: " << (loadedConfig.isValid() ? "yes" : "no") << std::endl;
}

/**
 * @brief Resolve records from files and print the result
 */
int runFiles(const std::string& configPath, const std::string& recordsPath) {
    DeduplicatorConfig config = JsonLoader::loadFromFile(configPath);
    observability::initializeLogging(config.logging);

    RecordList records = RecordReader::readFile(recordsPath);
    Deduplicator deduplicator(config);
    std::cout << JsonSaver::clustersToString(deduplicator(records));
    return 0;
}

/**
 * @brief Main entry point
 */
int main(int argc, char** argv) {
    try {
        if (argc == 3) {
            return runFiles(argv[1], argv[2]);
        }
        if (argc != 1) {
            std::cerr << "Usage: " << argv[0] << " [config.json records.json]" << std::endl;
            return 2;
        }

        observability::LoggingConfig logging;
        logging.level = "warn";
        observability::initializeLogging(logging);

        std::cout << "========================================" << std::endl;
        std::cout << "       Dedup - Demo Application         " << std::endl;
        std::cout << "========================================" << std::endl;

        demoContacts();
        demoBenchmark();
        demoJsonConfig();

        std::cout << "\n========================================" << std::endl;
        std::cout << "   All demos completed successfully!    " << std::endl;
        std::cout << "========================================" << std::endl;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
