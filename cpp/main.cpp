#include "engine.h"
#include "errors.h"
#include "json_codec.h"
#include "log.h"
#include "scorer.h"
#include <fstream>
#include <iostream>
#include <memory>
#include <string>

namespace {

void usage(const char* argv0) {
    std::cerr << "usage: " << argv0
              << " [--config FILE] [--risk-model FILE] [--anomaly-model FILE]"
                 " [--log-level debug|info|warn|error] [INPUT]\n"
                 "Reads one JSON transaction per line from INPUT (default stdin)\n"
                 "and writes one JSON verdict per line to stdout.\n";
}

std::shared_ptr<const txguard::Scorer> load_scorer(const std::string& path) {
    if (path.empty()) return nullptr;
    return std::make_shared<txguard::LogisticScorer>(txguard::LogisticScorer::load(path));
}

} // namespace

int main(int argc, char** argv) {
    std::string config_path, risk_path, anomaly_path, input_path;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        const bool has_value = i + 1 < argc;
        if (arg == "--config" && has_value) config_path = argv[++i];
        else if (arg == "--risk-model" && has_value) risk_path = argv[++i];
        else if (arg == "--anomaly-model" && has_value) anomaly_path = argv[++i];
        else if (arg == "--log-level" && has_value) {
            txguard::log::Level level;
            if (!txguard::log::parse_level(argv[++i], level)) {
                usage(argv[0]);
                return 2;
            }
            txguard::log::set_level(level);
        } else if (arg == "-h" || arg == "--help") {
            usage(argv[0]);
            return 0;
        } else if (!arg.empty() && arg[0] != '-' && input_path.empty()) {
            input_path = arg;
        } else {
            usage(argv[0]);
            return 2;
        }
    }

    std::unique_ptr<txguard::DecisionEngine> engine;
    try {
        txguard::EngineConfig config;
        if (!config_path.empty()) config = txguard::load_config_file(config_path);
        engine = std::make_unique<txguard::DecisionEngine>(
            config, load_scorer(risk_path), load_scorer(anomaly_path));
    } catch (const txguard::ConfigError& e) {
        txguard::log::error("MAIN", e.what());
        return 2;
    }

    std::istream* in = &std::cin;
    std::ifstream f;
    if (!input_path.empty()) {
        f.open(input_path);
        if (!f) {
            txguard::log::error("MAIN", "cannot open input: " + input_path);
            return 2;
        }
        in = &f;
    }

    std::string line;
    std::size_t lineno = 0;
    while (std::getline(*in, line)) {
        ++lineno;
        if (line.find_first_not_of(" \t\r") == std::string::npos) continue;

        const nlohmann::json out = txguard::process_line(*engine, line, lineno);
        std::cout << out.dump() << "\n";
    }
    std::cout.flush();

    const txguard::EngineStats s = engine->stats();
    txguard::log::info("MAIN", "processed " + std::to_string(s.decisions) + " decisions, " +
                                   std::to_string(s.replays) + " replays, " +
                                   std::to_string(s.invalid) + " invalid, " +
                                   std::to_string(s.degraded) + " degraded");
    return 0;
}
