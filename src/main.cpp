#include "config/config_loader.hpp"
#include "core/utils.hpp"
#include "tracing/trace_id.hpp"

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <format>
#include <iostream>
#include <string>
#include <vector>

using namespace traceid;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitConfigError = 1;
constexpr int kExitUsage = 2;

void print_usage() {
    std::cerr <<
        "Usage: traceid [--config FILE] <command>\n"
        "\n"
        "Commands:\n"
        "  new [N]        print N fresh trace ids (default 1)\n"
        "  parse TEXT     print the trace id TEXT resolves to\n"
        "  inspect TEXT   print a JSON breakdown of TEXT\n"
        "  invalid        print the \"no trace\" sentinel\n";
}

nlohmann::json inspect(const std::string& text) {
    const auto parsed = TraceId::try_parse(text);
    const TraceId id = parsed.is_ok() ? parsed.value() : TraceId::parse(text);

    nlohmann::json out;
    out["input"] = text;
    out["trace_id"] = id.to_string();
    out["valid"] = parsed.is_ok();
    if (parsed.is_error()) {
        out["error"] = parsed.error_message();
    }
    out["epoch_seconds"] = id.epoch_seconds();
    out["random"] = std::format("{:08x}{:016x}", id.random().high, id.random().low);
    out["invalid"] = id.is_invalid();
    return out;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    try {
        std::vector<std::string> args(argv + 1, argv + argc);

        if (args.size() >= 2 && args[0] == "--config") {
            const std::string config_file = args[1];
            args.erase(args.begin(), args.begin() + 2);

            auto config_result = ConfigLoader::load_from_file(config_file);
            if (!config_result.success) {
                utils::log::error(config_result.error_message);
                return kExitConfigError;
            }
            ConfigLoader::apply(config_result.config);
        }

        if (args.empty()) {
            print_usage();
            return kExitUsage;
        }

        const std::string& command = args[0];

        if (command == "new") {
            size_t count = 1;
            if (args.size() > 1) {
                const auto n = utils::try_parse_uint<size_t>(args[1]);
                if (!n) {
                    utils::log::error(std::format("Invalid count '{}'", args[1]));
                    return kExitUsage;
                }
                count = *n;
            }
            for (size_t i = 0; i < count; ++i) {
                std::cout << TraceId::create() << '\n';
            }
            return kExitOk;
        }

        if (command == "parse" && args.size() == 2) {
            std::cout << TraceId::parse(args[1]) << '\n';
            return kExitOk;
        }

        if (command == "inspect" && args.size() == 2) {
            std::cout << inspect(args[1]).dump(2) << '\n';
            return kExitOk;
        }

        if (command == "invalid") {
            std::cout << TraceId::invalid() << '\n';
            return kExitOk;
        }

        print_usage();
        return kExitUsage;

    } catch (const std::exception& e) {
        utils::log::error(std::format("Fatal error: {}", e.what()));
        return EXIT_FAILURE;
    }
}
