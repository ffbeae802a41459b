#include "config.hpp"
#include "engine.hpp"
#include "input.hpp"
#include "state.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <fstream>
#include <iostream>
#include <map>
#include <memory>
#include <string>

namespace {
const std::map<std::string, spdlog::level::level_enum> kLogLevels = {
    {"debug", spdlog::level::debug},
    {"info", spdlog::level::info},
    {"warn", spdlog::level::warn},
    {"error", spdlog::level::err}
};

// stderr only: stdout is reserved for the JSON output stream
void init_perception_logger(const std::string& level_name) {
    auto level = kLogLevels.find(level_name);
    auto logger = std::make_shared<spdlog::logger>(
        "perception", std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    logger->set_level(level != kLogLevels.end() ? level->second : spdlog::level::info);
    spdlog::set_default_logger(logger);

    if (level == kLogLevels.end()) {
        spdlog::warn("Unknown LOG_LEVEL '{}', using info", level_name);
    }
}
}

int main(int argc, char** argv) {
    try {
        PerceptionConfig config = PerceptionConfig::from_env();
        init_perception_logger(config.log_level);
        config.validate();

        std::string input_path;
        if (argc > 1) {
            input_path = argv[1];
        } else if (const char* env = std::getenv("INPUT_PATH")) {
            input_path = env;
        }
        if (input_path.empty()) {
            spdlog::error("Usage: {} <cycles.jsonl>", argv[0]);
            return 1;
        }

        std::ifstream in(input_path);
        if (!in) {
            spdlog::error("Cannot open {}", input_path);
            return 1;
        }

        spdlog::info("Replaying perception cycles from {}", input_path);

        std::optional<PerceptionState> state;
        std::string line;
        int line_no = 0;
        int cycles = 0;
        int blocked = 0;
        int skipped = 0;

        while (std::getline(in, line)) {
            line_no++;
            if (line.empty()) continue;

            try {
                auto input = nlohmann::json::parse(line).get<MetaPerceptionInput>();
                InputValidator::validate(input);

                if (state && input.ts_ms <= state->ts_ms) {
                    throw std::runtime_error("timestamp does not advance past previous cycle");
                }

                auto result = MetaPerceptionEngine::step(state, input, config);
                std::cout << nlohmann::json(result.output).dump() << '\n';

                if (!result.state.should_act) blocked++;
                state = std::move(result.state);
                cycles++;
            } catch (const nlohmann::json::exception& e) {
                spdlog::error("Line {}: malformed JSON: {}", line_no, e.what());
                skipped++;
            } catch (const std::runtime_error& e) {
                spdlog::error("Line {}: rejected input: {}", line_no, e.what());
                skipped++;
            }
        }

        spdlog::info("Replay complete: {} cycles, {} blocked, {} skipped", cycles, blocked, skipped);
        return 0;

    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
