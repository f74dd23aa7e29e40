#include "cli/common/bootstrap.hpp"
#include "src/core/batch/BatchIdentifier.hpp"
#include "src/core/embedding/EmbeddingModelFactory.hpp"
#include "src/core/enrichment/CardEnricher.hpp"
#include "src/core/enrichment/FileCatalogClient.hpp"
#include "src/core/index/IndexLoader.hpp"
#include "src/core/matching/CardMatcher.hpp"
#include "interfaces/IEmbeddingModel.hpp"
#include "card_identifier/logging.hpp"
#include <boost/filesystem.hpp>
#include <opencv2/imgcodecs.hpp>
#include <algorithm>
#include <atomic>
#include <csignal>
#include <iomanip>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace {

std::atomic<bool> g_cancel{false};

void handleInterrupt(int) {
    g_cancel.store(true);
}

struct CliOptions {
    std::vector<std::string> inputs;
    bool paired = false;
    bool paired_set = false;
    bool enrich = false;
    std::optional<cv::Rect> sticker;
};

void printUsage(const std::string& binaryName) {
    std::cout << "Usage: " << binaryName << " [--config <file.yaml>] [options] <image|folder>..." << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  -h, --help                 Show this help message and exit" << std::endl;
    std::cout << "  -c, --config <file.yaml>   Configuration (database, thresholds, model)" << std::endl;
    std::cout << "  --paired                   Scans alternate front, back, front, back, ..." << std::endl;
    std::cout << "  --unpaired                 Every scan is a separate card (overrides batch.paired)" << std::endl;
    std::cout << "  --enrich                   Show variants and set size from enrichment.catalog_dir" << std::endl;
    std::cout << "  --sticker x,y,w,h          Sticker rectangle in scan pixels (single image only)" << std::endl;
}

bool isImageFile(const boost::filesystem::path& path) {
    std::string ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) { return std::tolower(c); });
    return ext == ".png" || ext == ".jpg" || ext == ".jpeg" || ext == ".bmp" || ext == ".tif" || ext == ".tiff";
}

// Folders expand to their image files in name order, so front/back pairing follows file names.
std::vector<std::string> collectScans(const std::vector<std::string>& inputs) {
    std::vector<std::string> scans;
    for (const auto& input : inputs) {
        const boost::filesystem::path path(input);
        if (boost::filesystem::is_directory(path)) {
            std::vector<std::string> folder;
            for (const auto& entry : boost::filesystem::directory_iterator(path)) {
                if (boost::filesystem::is_regular_file(entry.path()) && isImageFile(entry.path())) {
                    folder.push_back(entry.path().string());
                }
            }
            std::sort(folder.begin(), folder.end());
            scans.insert(scans.end(), folder.begin(), folder.end());
        } else {
            scans.push_back(input);
        }
    }
    return scans;
}

std::optional<cv::Rect> parseRect(const std::string& value) {
    std::istringstream stream(value);
    int x = 0, y = 0, w = 0, h = 0;
    char c1 = 0, c2 = 0, c3 = 0;
    if (!(stream >> x >> c1 >> y >> c2 >> w >> c3 >> h) || c1 != ',' || c2 != ',' || c3 != ',' || w <= 0 || h <= 0) {
        return std::nullopt;
    }
    return cv::Rect(x, y, w, h);
}

std::string formatDistance(const std::optional<double>& distance, int precision) {
    if (!distance) {
        return "-";
    }
    std::ostringstream out;
    out << std::fixed << std::setprecision(precision) << *distance;
    return out.str();
}

void printDetails(const card_identifier::CardDetails& details) {
    if (details.variants) {
        const auto& v = *details.variants;
        std::cout << "       variants:";
        if (v.normal) std::cout << " normal";
        if (v.reverse) std::cout << " reverse";
        if (v.holo) std::cout << " holo";
        if (v.first_edition) std::cout << " 1st-edition";
        if (v.w_promo) std::cout << " w-promo";
        std::cout << std::endl;
    }
    if (details.set_total) {
        std::cout << "       set size: " << *details.set_total << std::endl;
    }
}

void printResult(const card_identifier::batch::ScanResult& scan,
                 card_identifier::enrichment::CardEnricher* enricher) {
    std::cout << "Scan #" << scan.pair.scan_id << ": " << scan.pair.front;
    if (scan.pair.back) {
        std::cout << " (back: " << *scan.pair.back << ")";
    }
    std::cout << std::endl;

    if (!scan.processed) {
        std::cout << "  ⏹  cancelled" << std::endl;
        return;
    }
    const auto& result = scan.result;
    if (!result.error.empty()) {
        std::cout << "  ❌ " << result.error << std::endl;
        return;
    }

    std::cout << "  boundary=" << (result.boundary_detected ? "yes" : "no")
              << " sticker=" << (result.sticker_detected ? "yes" : "no")
              << " embedding=" << (result.embedding_used ? "yes" : "no");
    if (result.degraded) {
        std::cout << " ⚠️  degraded (embedding stage unavailable)";
    }
    std::cout << std::endl;

    if (result.candidates.empty()) {
        std::cout << "  (no candidates)" << std::endl;
        return;
    }

    int rank = 1;
    for (const auto& candidate : result.candidates) {
        const auto& card = *candidate.card;
        std::cout << "  " << rank << ". " << card.id << "  " << card.name;
        if (!card.set_name.empty() || !card.number.empty()) {
            std::cout << "  [" << card.set_name << " " << card.number << "]";
        }
        std::cout << "  tier=" << card_identifier::toString(candidate.tier)
                  << " hash=" << formatDistance(candidate.hash_distance, 1)
                  << " emb=" << formatDistance(candidate.embedding_distance, 4) << std::endl;

        if (enricher && rank == 1) {
            if (const auto details = enricher->details(card.id)) {
                printDetails(*details);
            }
        }
        ++rank;
    }
}

} // namespace

using namespace card_identifier;

/**
 * @brief Identify scanned cards against the reference store
 */
int main(int argc, char** argv) {
    std::string config_path;
    try {
        config_path = cli::bootstrap::extractConfigPath(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "❌ " << e.what() << std::endl;
        return 1;
    }

    CliOptions options;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return 0;
        } else if (arg == "--paired") {
            options.paired = true;
            options.paired_set = true;
        } else if (arg == "--unpaired") {
            options.paired = false;
            options.paired_set = true;
        } else if (arg == "--enrich") {
            options.enrich = true;
        } else if (arg == "--sticker") {
            if (i + 1 >= argc || !(options.sticker = parseRect(argv[++i]))) {
                std::cerr << "❌ --sticker expects x,y,w,h with positive width and height" << std::endl;
                return 1;
            }
        } else {
            options.inputs.push_back(arg);
        }
    }

    if (options.inputs.empty()) {
        printUsage(argv[0]);
        return 1;
    }

    cli::bootstrap::BootstrapResult boot;
    try {
        boot = cli::bootstrap::loadConfigAndDatabase(config_path);
    } catch (const std::exception& e) {
        std::cerr << "❌ " << e.what() << std::endl;
        return 1;
    }
    if (!boot.db_enabled) {
        std::cerr << "❌ Failed to connect to database" << std::endl;
        return 1;
    }
    const auto& config = boot.config;

    std::unique_ptr<matching::CardMatcher> matcher;
    try {
        auto indices = index::IndexLoader::load(*boot.db, config);
        std::shared_ptr<IEmbeddingModel> model;
        if (config.matching.mode != MatchMode::HASH_ONLY) {
            model = embedding::EmbeddingModelFactory::create(config.embedding);
        }
        matcher = std::make_unique<matching::CardMatcher>(config, std::move(indices), model);
    } catch (const std::exception& e) {
        std::cerr << "❌ " << e.what() << std::endl;
        return 1;
    }

    std::unique_ptr<enrichment::CardEnricher> enricher;
    if (options.enrich) {
        std::shared_ptr<ICatalogClient> client;
        if (!config.enrichment.catalog_dir.empty()) {
            client = std::make_shared<enrichment::FileCatalogClient>(config.enrichment.catalog_dir);
        } else {
            LOG_WARNING("enrichment.catalog_dir is not set - only cached details are shown");
        }
        enricher = std::make_unique<enrichment::CardEnricher>(client, boot.db.get(), config.enrichment.persist);
    }

    const auto scans = collectScans(options.inputs);
    const bool paired = options.paired_set ? options.paired : config.batch.paired;

    if (options.sticker) {
        if (scans.size() != 1 || paired) {
            std::cerr << "❌ --sticker applies to exactly one unpaired image" << std::endl;
            return 1;
        }
        batch::ScanResult single;
        single.pair = {0, scans.front(), std::nullopt};
        const cv::Mat image = cv::imread(scans.front(), cv::IMREAD_COLOR);
        if (image.empty()) {
            single.result.error = "Cannot read image: " + scans.front();
        } else {
            single.result = matcher->identify(image, options.sticker);
        }
        single.processed = true;
        printResult(single, enricher.get());
        return single.result.error.empty() ? 0 : 1;
    }

    std::signal(SIGINT, handleInterrupt);

    std::vector<batch::ScanResult> results;
    try {
        const batch::BatchIdentifier identifier(*matcher, config.performance);
        results = identifier.runScans(scans, paired, &g_cancel, [](std::size_t done, std::size_t total) {
            if (done % 25 == 0 || done == total) {
                LOG_INFO("Identified " + std::to_string(done) + "/" + std::to_string(total) + " scans");
            }
        });
    } catch (const batch::BatchSizeError& e) {
        std::cerr << "❌ " << e.what() << std::endl;
        return 1;
    }

    int failures = 0;
    for (const auto& scan : results) {
        printResult(scan, enricher.get());
        if (!scan.processed || !scan.result.error.empty()) {
            ++failures;
        }
    }

    if (g_cancel.load()) {
        std::cerr << "⏹  Cancelled" << std::endl;
        return 130;
    }
    return failures == 0 ? 0 : 1;
}
