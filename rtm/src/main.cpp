#include "config.hpp"
#include "downloader.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "registry.hpp"
#include "runtime_manager.hpp"
#include "utils.hpp"

#include <cxxopts.hpp>

#include <chrono>
#include <cstdlib>
#include <ctime>
#include <functional>
#include <future>
#include <iomanip>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace {

void print_usage(const cxxopts::Options& options) {
    std::cerr << options.help({""});
    std::cerr << get_string("info.commands") << std::endl;
    std::cerr << get_string("info.resolve_desc") << std::endl;
    std::cerr << get_string("info.install_desc") << std::endl;
    std::cerr << get_string("info.list_desc") << std::endl;
    std::cerr << get_string("info.evict_desc") << std::endl;
    std::cerr << get_string("info.current_desc") << std::endl;
    std::cerr << get_string("info.gc_desc") << std::endl;
    std::cerr << get_string("info.versions_desc") << std::endl;
}

void check_arg_count(const cxxopts::ParseResult& result, std::function<void()> print_usage_func, size_t min, std::optional<size_t> max = std::nullopt) {
    size_t count = result.count("args") ? result["args"].as<std::vector<std::string>>().size() : 0;
    if (count < min || (max.has_value() && count > max.value())) {
        print_usage_func();
        throw RtmException(ErrorKind::InvalidArgument, get_string("error.invalid_arg_count"));
    }
}

std::string format_time(std::chrono::system_clock::time_point tp) {
    const std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    localtime_r(&t, &tm);
    std::ostringstream out;
    out << std::put_time(&tm, "%Y-%m-%d %H:%M");
    return out.str();
}

void draw_progress(const std::string& version_id, const ProgressSnapshot& snapshot) {
    if (snapshot.state != InstallState::Staging || snapshot.bytes_total == 0) return;
    const double pct = 100.0 * static_cast<double>(snapshot.bytes_done) / static_cast<double>(snapshot.bytes_total);
    log_progress(string_format("info.downloading", version_id), pct);
}

// Registry is only contacted by commands that need it.
std::shared_ptr<RegistrySource> open_registry(const Settings& settings, bool needed) {
    if (!needed) {
        return std::make_shared<StaticRegistry>();
    }
    TransferOptions transfer;
    transfer.connect_timeout_s = settings.connect_timeout_s;
    transfer.low_speed_timeout_s = settings.low_speed_timeout_s;
    transfer.transfer_timeout_s = settings.transfer_timeout_s;
    return std::make_shared<IndexRegistry>(get_registry_url(settings), transfer);
}

int run_resolve(RuntimeManager& manager, const std::string& requirement) {
    auto pending = std::async(std::launch::async, [&manager, &requirement]() {
        return manager.resolve_runtime(requirement);
    });
    while (pending.wait_for(std::chrono::milliseconds(100)) != std::future_status::ready) {
        draw_progress(requirement, manager.get_install_progress(requirement));
    }
    end_progress();

    ResolutionResult result = pending.get();
    if (!result.ok()) {
        log_error(string_format("error.resolve_failed", requirement, std::string(error_kind_name(result.reason)), result.message));
        return 1;
    }
    // The resolved path is the command's output.
    std::cout << result.path.string() << std::endl;
    return 0;
}

void run_list(RuntimeManager& manager) {
    auto entries = manager.list_cached();
    if (entries.empty()) {
        log_info(get_string("info.cache_empty"));
        return;
    }
    for (const auto& entry : entries) {
        std::cout << (entry.is_current ? "* " : "  ")
                  << std::left << std::setw(28) << entry.version_id
                  << std::setw(18) << format_time(entry.last_used)
                  << entry.size_bytes << std::endl;
    }
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    try {
        init_localization();
        ensure_curl_initialized();

        cxxopts::Options options(argv[0]);
        options.custom_help(get_string("info.usage"));
        options.set_width(100);

        options.add_options()
            ("h,help", get_string("info.help_desc"))
            ("root", get_string("help.root_dir"), cxxopts::value<std::string>())
            ("cache-dir", get_string("help.cache_dir"), cxxopts::value<std::string>())
            ("registry", get_string("help.registry"), cxxopts::value<std::string>())
            ("keep", get_string("help.keep"), cxxopts::value<size_t>())
            ("q,quiet", get_string("help.quiet"), cxxopts::value<bool>()->default_value("false"))
            ("command", "", cxxopts::value<std::string>())
            ("args", "", cxxopts::value<std::vector<std::string>>());

        options.parse_positional({"command", "args"});

        auto result = options.parse(argc, argv);

        if (result.count("help")) {
            print_usage(options);
            return 0;
        }

        if (result.count("quiet")) {
            set_quiet_mode(result["quiet"].as<bool>());
        }

        if (result.count("root")) {
            set_root_path(result["root"].as<std::string>());
        }

        if (result.count("cache-dir")) {
            set_cache_dir(result["cache-dir"].as<std::string>());
        } else if (const char* env_cache = std::getenv("RTM_CACHE_DIR"); env_cache && *env_cache) {
            set_cache_dir(env_cache);
        }

        if (!result.count("command")) {
            print_usage(options);
            return 1;
        }

        const std::string& command = result["command"].as<std::string>();
        auto usage_printer = [&]() { print_usage(options); };

        Settings settings = load_settings();
        if (result.count("registry")) {
            settings.registry_url = result["registry"].as<std::string>();
        }

        init_filesystem();
        CacheLock cache_lock(CACHE_DIR);

        const bool needs_registry = command == "resolve" || command == "install" || command == "versions";
        RuntimeManager manager(CACHE_DIR, open_registry(settings, needs_registry), settings);

        if (command == "resolve") {
            check_arg_count(result, usage_printer, 1, 1);
            return run_resolve(manager, result["args"].as<std::vector<std::string>>()[0]);
        } else if (command == "install") {
            check_arg_count(result, usage_printer, 1);
            for (const auto& id : result["args"].as<std::vector<std::string>>()) {
                auto path = manager.install(id, {}, [&id](const ProgressSnapshot& snapshot) { draw_progress(id, snapshot); });
                end_progress();
                log_info(string_format("info.version_ready", id, path.string()));
            }
        } else if (command == "list") {
            check_arg_count(result, usage_printer, 0, 0);
            run_list(manager);
        } else if (command == "evict") {
            check_arg_count(result, usage_printer, 1);
            for (const auto& id : result["args"].as<std::vector<std::string>>()) {
                manager.evict(id);
            }
        } else if (command == "current") {
            check_arg_count(result, usage_printer, 0, 1);
            if (result.count("args")) {
                const auto& id = result["args"].as<std::vector<std::string>>()[0];
                manager.set_current(id);
                log_info(string_format("info.current_set", id));
            } else if (auto current = manager.current()) {
                std::cout << *current << std::endl;
            } else {
                log_info(get_string("info.no_current"));
            }
        } else if (command == "gc") {
            check_arg_count(result, usage_printer, 0, 0);
            const size_t keep = result.count("keep") ? result["keep"].as<size_t>() : settings.keep_versions;
            auto evicted = manager.collect_garbage(keep);
            log_info(string_format("info.gc_complete", evicted.size()));
        } else if (command == "versions") {
            check_arg_count(result, usage_printer, 0, 0);
            for (const auto& release : manager.list_available()) {
                const bool cached = manager.cache().path(release.id).has_value();
                std::cout << (cached ? "* " : "  ") << release.id << std::endl;
            }
        } else {
            usage_printer();
            return 1;
        }

    } catch (const cxxopts::exceptions::exception& e) {
        end_progress();
        log_error(string_format("error.cmd_parse_error", e.what()));
        return 1;
    } catch (const RtmException& e) {
        end_progress();
        log_error(string_format("error.rtm_error", std::string(error_kind_name(e.kind())), e.what()));
        return 1;
    } catch (const std::exception& e) {
        end_progress();
        log_error(string_format("error.unexpected_error", e.what()));
        return 1;
    }

    return 0;
}
