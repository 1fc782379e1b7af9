#include "cancellation.hpp"
#include "config.hpp"
#include "downloader.hpp"
#include "exception.hpp"
#include "integrity.hpp"
#include "localization.hpp"
#include "package_manager.hpp"
#include "utils.hpp"

#include <cxxopts.hpp>

#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

void print_usage(const cxxopts::Options& options) {
    std::cerr << options.help({""});
    std::cerr << get_string("info.commands") << std::endl;
    std::cerr << get_string("info.init_desc") << std::endl;
    std::cerr << get_string("info.update_index_desc") << std::endl;
    std::cerr << get_string("info.install_desc") << std::endl;
    std::cerr << get_string("info.uninstall_desc") << std::endl;
    std::cerr << get_string("info.update_desc") << std::endl;
    std::cerr << get_string("info.list_desc") << std::endl;
    std::cerr << get_string("info.list_cached_desc") << std::endl;
    std::cerr << get_string("info.checksum_create_desc") << std::endl;
    std::cerr << get_string("info.checksum_verify_desc") << std::endl;
    std::cerr << get_string("info.signature_create_desc") << std::endl;
}

std::vector<std::string> positional_args(const cxxopts::ParseResult& result) {
    return result.count("packages") ? result["packages"].as<std::vector<std::string>>() : std::vector<std::string>{};
}

void pre_operation_check(const cxxopts::ParseResult& result, std::function<void()> print_usage_func, size_t min, std::optional<size_t> max = std::nullopt) {
    size_t count = positional_args(result).size();
    if (count < min || (max.has_value() && count > max.value())) {
        print_usage_func();
        throw PackgetException(ErrorKind::Usage, get_string("error.invalid_arg_count"));
    }
}

std::string option_string(const cxxopts::ParseResult& result, const std::string& name) {
    return result.count(name) ? result[name].as<std::string>() : std::string();
}

// Runs a batch and persists what it recorded, also when the batch was cancelled.
bool run_batch(PackManager& manager, const std::function<bool()>& batch) {
    bool ok = false;
    try {
        ok = batch();
    } catch (const PackgetException& e) {
        if (e.kind() == ErrorKind::Cancelled) {
            manager.save();
        }
        throw;
    }
    manager.save();
    return ok;
}

int main(int argc, char* argv[]) {
    CurlGlobalInitializer curl_initializer;
    CancellationToken token;
    install_signal_handlers(token);

    try {
        init_localization();

        cxxopts::Options options(argv[0]);
        options.custom_help(get_string("info.usage"));
        options.set_width(100);

        options.add_options()
            ("h,help", get_string("info.help_desc"))
            ("R,pack-root", get_string("help.pack_root"), cxxopts::value<std::string>())
            ("v,verbose", get_string("help.verbose"), cxxopts::value<bool>()->default_value("false"))
            ("q,quiet", get_string("help.quiet"), cxxopts::value<bool>()->default_value("false"))
            ("purge", get_string("help.purge"), cxxopts::value<bool>()->default_value("false"))
            ("hash", get_string("help.hash"), cxxopts::value<std::string>())
            ("checksum", get_string("help.checksum"), cxxopts::value<std::string>())
            ("signature", get_string("help.signature"), cxxopts::value<std::string>())
            ("pubkey", get_string("help.pubkey"), cxxopts::value<std::string>())
            ("key", get_string("help.private_key"), cxxopts::value<std::string>())
            ("public", get_string("help.public"), cxxopts::value<bool>()->default_value("false"))
            ("c,cached", get_string("help.cached"), cxxopts::value<bool>()->default_value("false"))
            ("f,packs-list-filename", get_string("help.packs_list"), cxxopts::value<std::string>())
            ("filter", get_string("help.filter"), cxxopts::value<std::string>())
            ("o,output", get_string("help.output"), cxxopts::value<std::string>())
            ("command", "", cxxopts::value<std::string>())
            ("packages", "", cxxopts::value<std::vector<std::string>>());

        options.parse_positional({"command", "packages"});

        auto result = options.parse(argc, argv);

        if (result.count("help")) {
            print_usage(options);
            return 0;
        }

        if (result["verbose"].as<bool>()) {
            set_log_level(LogLevel::VERBOSE);
        } else if (result["quiet"].as<bool>()) {
            set_log_level(LogLevel::QUIET);
        }

        if (!result.count("command")) {
            print_usage(options);
            return 1;
        }

        const std::string& command = result["command"].as<std::string>();
        auto usage_printer = [&]() { print_usage(options); };
        auto args = positional_args(result);

        // Commands that work on a single pack file and need no pack root.
        if (command == "checksum-create") {
            pre_operation_check(result, usage_printer, 1, 1);
            generate_checksum_file(args[0], option_string(result, "output"));
            return 0;
        }
        if (command == "checksum-verify") {
            pre_operation_check(result, usage_printer, 1, 1);
            std::string checksum = option_string(result, "checksum");
            verify_checksum_file(args[0], checksum.empty() ? checksum_file_name(args[0]) : fs::path(checksum));
            return 0;
        }
        if (command == "signature-create") {
            pre_operation_check(result, usage_printer, 1, 1);
            const std::string key = option_string(result, "key");
            if (key.empty()) {
                throw PackgetException(ErrorKind::Usage, get_string("error.private_key_required"));
            }
            std::string output = option_string(result, "output");
            sign_file(args[0], key, output.empty() ? args[0] + ".sig" : output);
            return 0;
        }

        std::string pack_root = option_string(result, "pack-root");
        if (pack_root.empty()) {
            pack_root = get_default_pack_root();
        }
        set_pack_root(pack_root);
        init_filesystem();
        PackRootLock root_lock;

        PackManager manager(token, fetch_pack);
        manager.init(pack_root);

        if (command == "init") {
            pre_operation_check(result, usage_printer, 0, 1);
            if (!args.empty()) {
                manager.update_public_index(args[0]);
                manager.save();
            }
            log_info(string_format("info.pack_root_ready", PACK_ROOT.string()));
        } else if (command == "update-index") {
            pre_operation_check(result, usage_printer, 0, 1);
            std::string source = args.empty() ? manager.web_index().url() : args[0];
            if (source.empty()) {
                source = DEFAULT_PUBLIC_INDEX_URL;
            }
            manager.update_public_index(source);
            manager.save();
        } else if (command == "install" || command == "add") {
            if (result.count("packs-list-filename")) {
                const auto listed = read_packs_list(result["packs-list-filename"].as<std::string>());
                args.insert(args.end(), listed.begin(), listed.end());
            } else {
                pre_operation_check(result, usage_printer, 1);
            }
            if (args.empty()) {
                return 0;
            }
            InstallOptions install_options;
            if (result.count("hash")) {
                install_options.verification.expected_sha256 = read_hash_file(result["hash"].as<std::string>());
            }
            install_options.verification.checksum_file = option_string(result, "checksum");
            install_options.verification.signature_file = option_string(result, "signature");
            install_options.verification.public_key_file = option_string(result, "pubkey");
            if (!install_options.verification.empty() && args.size() != 1) {
                throw PackgetException(ErrorKind::Usage, get_string("error.verification_single_pack"));
            }
            manager.check_staleness();
            bool ok = run_batch(manager, [&]() { return manager.install(args, install_options); });
            if (!ok) {
                return 1;
            }
            log_info(get_string("info.install_complete"));
        } else if (command == "update") {
            if (result.count("packs-list-filename")) {
                const auto listed = read_packs_list(result["packs-list-filename"].as<std::string>());
                if (listed.empty()) {
                    return 0;
                }
                args.insert(args.end(), listed.begin(), listed.end());
            }
            manager.check_staleness();
            bool ok = run_batch(manager, [&]() { return manager.update(args); });
            if (!ok) {
                return 1;
            }
            log_info(get_string("info.update_complete"));
        } else if (command == "uninstall" || command == "rm") {
            pre_operation_check(result, usage_printer, 1);
            bool purge = result["purge"].as<bool>();
            bool ok = run_batch(manager, [&]() { return manager.uninstall(args, purge); });
            if (!ok) {
                return 1;
            }
            log_info(get_string("info.uninstall_complete"));
        } else if (command == "list") {
            pre_operation_check(result, usage_printer, 0, 0);
            const std::string filter = option_string(result, "filter");
            const auto packs = result["cached"].as<bool>() ? manager.list_cached(filter)
                                                           : manager.list_installed(filter, result["public"].as<bool>());
            for (const auto& tag : packs) {
                std::cout << tag.pack_id();
                if (!tag.url.empty()) {
                    std::cout << " (" << tag.url << ")";
                }
                if (!tag.deprecated.empty()) {
                    std::cout << " " << string_format("info.deprecated_since", tag.deprecated);
                }
                std::cout << std::endl;
            }
        } else {
            usage_printer();
            return 1;
        }

    } catch (const cxxopts::exceptions::exception& e) {
        log_error(string_format("error.cmd_parse_error", e.what()));
        return 1;
    } catch (const PackgetException& e) {
        log_error(string_format("error.packget_error", e.what()));
        return 1;
    } catch (const std::exception& e) {
        log_error(string_format("error.unexpected_error", e.what()));
        return 1;
    }

    return 0;
}
