// Copyright (c) 2024-2026 The ELMS Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

// ---------------------------------------------------------------------------
// elms-cli -- Elements descriptor and spend inspection tool
//
// Usage:
//   elms-cli [options] <command> [args...]
//
// Commands:
//   checksum <desc>                       Print <desc> with its checksum
//   parse <desc>                          Canonical form, scriptPubKey,
//                                         address and max weight
//   script <desc>                         Print the explicit script
//   classify <spk> <scriptsig> [wit...]   Classify a spend (hex arguments)
//
// Options:
//   -network=NAME     elements (default), liquid, liquidtestnet
//   -blinder=HEX      Show confidential addresses under this blinding key
//   -loglevel=LEVEL   trace, debug, info, warn, error, fatal, off
//   -logfile=FILE     Append log output to FILE
//   -conf=FILE        Read options from FILE
//   -debug[=CAT]      Trace everything, or only category CAT (repeatable)
//   -quiet            Disable logging
// ---------------------------------------------------------------------------

#include "core/config.h"
#include "core/hex.h"
#include "core/logging.h"
#include "descriptor/checksum.h"
#include "descriptor/covenant.h"
#include "descriptor/descriptor.h"
#include "descriptor/pretaproot.h"
#include "interpreter/inner.h"
#include "primitives/address.h"

#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace {

using primitives::AddressParams;
using primitives::script::Script;

void print_usage() {
    std::cout
        << "Usage: elms-cli [options] <command> [args...]\n"
        << "\n"
        << "Commands:\n"
        << "  checksum <desc>                      Append the descriptor checksum\n"
        << "  parse <desc>                         Show scriptPubKey, address, weight\n"
        << "  script <desc>                        Show the explicit script\n"
        << "  classify <spk> <scriptsig> [wit...]  Classify a spend (hex)\n"
        << "\n"
        << "Options:\n"
        << "  -network=NAME    elements, liquid or liquidtestnet\n"
        << "  -blinder=HEX     Show confidential addresses under this key\n"
        << "  -loglevel=LEVEL  trace, debug, info, warn, error, fatal, off\n"
        << "  -logfile=FILE    Append log output to FILE\n"
        << "  -conf=FILE       Read options from FILE\n"
        << "  -debug[=CAT]     Trace all output, or only category CAT\n"
        << "  -quiet           Disable logging\n";
}

int fail(const core::Error& err) {
    LOG_ERROR(core::LogCategory::CLI, err.message());
    std::cerr << "error: " << err.message() << "\n";
    return EXIT_FAILURE;
}

int fail(const std::string& message) {
    std::cerr << "error: " << message << "\n";
    return EXIT_FAILURE;
}

// ---------------------------------------------------------------------------
// Configuration and logging
// ---------------------------------------------------------------------------

core::Result<void> load_config(core::Config& config, int argc, char* argv[]) {
    config.parse_args(argc, argv);
    if (auto conf = config.get(core::CONF_FILE); conf && !conf->empty()) {
        ELMS_TRY_VOID(config.parse_file(*conf));
    }
    return core::make_ok();
}

core::Result<void> init_logging(const core::Config& config) {
    auto& logger = core::Logger::instance();
    logger.set_level(core::LogLevel::WARN);

    if (auto level = config.get(core::CONF_LOGLEVEL)) {
        auto parsed = core::parse_log_level(*level);
        if (!parsed) {
            return core::make_error(core::ErrorCode::CONFIG_ERROR,
                                    "unknown log level: " + *level);
        }
        logger.set_level(*parsed);
    }
    // -debug traces everything; -debug=<category> traces only the named
    // categories and may be repeated.
    const auto debug = config.get_list(core::CONF_DEBUG);
    if (!debug.empty()) {
        logger.set_level(core::LogLevel::TRACE);
        logger.disable_category(core::LogCategory::ALL);
        for (const auto& name : debug) {
            if (name == "1") {
                logger.enable_category(core::LogCategory::ALL);
                continue;
            }
            auto cat = core::parse_log_category(name);
            if (!cat) {
                return core::make_error(core::ErrorCode::CONFIG_ERROR,
                                        "unknown log category: " + name);
            }
            logger.enable_category(*cat);
        }
    }
    if (config.get_bool(core::CONF_QUIET)) {
        logger.set_level(core::LogLevel::OFF);
    }
    if (auto file = config.get(core::CONF_LOGFILE); file && !file->empty()) {
        logger.set_log_file(*file);
        logger.set_print_to_file(true);
        logger.set_print_to_console(false);
    }
    return core::make_ok();
}

// ---------------------------------------------------------------------------
// Descriptor helpers
// ---------------------------------------------------------------------------

using AnyDescriptor =
    std::variant<descriptor::PreTaprootDescriptor,
                 descriptor::CovenantDescriptor>;

bool is_covenant(std::string_view desc) {
    auto open = desc.find('(');
    if (open == std::string_view::npos) return false;
    return descriptor::strip_elements_prefix(desc.substr(0, open)) ==
           "covwsh";
}

core::Result<AnyDescriptor> parse_any(std::string_view desc) {
    if (is_covenant(desc)) {
        ELMS_TRY_ASSIGN(cov, descriptor::CovenantDescriptor::from_str(desc));
        return AnyDescriptor(std::move(cov));
    }
    ELMS_TRY_ASSIGN(pre, descriptor::PreTaprootDescriptor::from_str(desc));
    return AnyDescriptor(std::move(pre));
}

// ---------------------------------------------------------------------------
// Commands
// ---------------------------------------------------------------------------

int cmd_checksum(const std::vector<std::string>& args) {
    if (args.size() != 2) return fail("checksum takes one descriptor");
    auto out = descriptor::with_checksum(args[1]);
    if (!out) return fail(out.error());
    std::cout << out.value() << "\n";
    return EXIT_SUCCESS;
}

int cmd_parse(const std::vector<std::string>& args,
              const AddressParams& params,
              const std::optional<miniscript::PublicKey>& blinder) {
    if (args.size() != 2) return fail("parse takes one descriptor");
    auto desc = parse_any(args[1]);
    if (!desc) return fail(desc.error());

    return std::visit(
        [&](const auto& d) {
            const Script spk = d.script_pubkey();
            std::cout << "descriptor:    " << d.to_string() << "\n";
            std::cout << "scriptpubkey:  " << spk.to_hex() << "\n";
            std::cout << "asm:           " << spk.to_asm() << "\n";

            auto addr = d.blind_addr(blinder, params);
            if (addr) {
                std::cout << "address:       " << addr.value().to_string()
                          << "\n";
            } else {
                std::cout << "address:       (" << addr.error().message()
                          << ")\n";
            }

            auto weight = d.max_satisfaction_weight();
            if (weight) {
                std::cout << "max weight:    " << weight.value() << "\n";
            } else {
                std::cout << "max weight:    (" << weight.error().message()
                          << ")\n";
            }

            auto sane = d.sanity_check();
            std::cout << "sane:          "
                      << (sane ? std::string("yes")
                               : "no (" + sane.error().message() + ")")
                      << "\n";
            return EXIT_SUCCESS;
        },
        desc.value());
}

int cmd_script(const std::vector<std::string>& args) {
    if (args.size() != 2) return fail("script takes one descriptor");
    auto desc = parse_any(args[1]);
    if (!desc) return fail(desc.error());
    const Script script = std::visit(
        [](const auto& d) { return d.explicit_script(); }, desc.value());
    std::cout << script.to_hex() << "\n" << script.to_asm() << "\n";
    return EXIT_SUCCESS;
}

int cmd_classify(const std::vector<std::string>& args) {
    if (args.size() < 3) {
        return fail("classify takes <spk> <scriptsig> [witness...]");
    }

    std::vector<std::vector<uint8_t>> decoded;
    for (size_t i = 1; i < args.size(); ++i) {
        auto bytes = core::from_hex(args[i]);
        if (!bytes) return fail("invalid hex argument: " + args[i]);
        decoded.push_back(std::move(*bytes));
    }

    const Script spk(std::move(decoded[0]));
    const Script script_sig(std::move(decoded[1]));
    std::vector<std::vector<uint8_t>> witness(
        std::make_move_iterator(decoded.begin() + 2),
        std::make_move_iterator(decoded.end()));

    auto txdata = interpreter::from_txdata(spk, script_sig, witness);
    if (!txdata) return fail(txdata.error());
    const auto& td = txdata.value();

    if (const auto* pk = std::get_if<interpreter::InnerPublicKey>(&td.inner)) {
        std::cout << "type:          "
                  << interpreter::pubkey_type_name(pk->type) << "\n";
        std::cout << "key:           " << pk->key.to_string() << "\n";
    } else if (const auto* script =
                   std::get_if<interpreter::InnerScript>(&td.inner)) {
        std::cout << "type:          "
                  << interpreter::script_type_name(script->type) << "\n";
        std::cout << "miniscript:    " << script->ms.to_string() << "\n";
    } else {
        const auto& cov = std::get<interpreter::InnerCovScript>(td.inner);
        std::cout << "type:          covenant\n";
        std::cout << "key:           " << cov.key.to_string() << "\n";
        std::cout << "miniscript:    " << cov.ms.to_string() << "\n";
    }

    std::cout << "stack items:   " << td.stack.size() << "\n";
    for (const auto& elem : td.stack.elements()) {
        std::cout << "  " << elem.to_string() << "\n";
    }
    if (td.script_code) {
        std::cout << "script code:   " << td.script_code->to_hex() << "\n";
    } else {
        std::cout << "script code:   (none)\n";
    }
    return EXIT_SUCCESS;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    core::Config config;
    if (auto r = load_config(config, argc, argv); !r) return fail(r.error());
    if (auto r = init_logging(config); !r) return fail(r.error());

    if (config.has("help") || config.has("h")) {
        print_usage();
        return EXIT_SUCCESS;
    }
    if (config.positional().empty()) {
        print_usage();
        return EXIT_FAILURE;
    }

    auto params = AddressParams::from_name(config.network());
    if (!params) return fail("unknown network: " + config.network());

    std::optional<miniscript::PublicKey> blinder;
    if (auto hex = config.get(core::CONF_BLINDER); hex && !hex->empty()) {
        auto key = miniscript::PublicKey::from_string(*hex);
        if (!key) return fail(key.error());
        blinder = std::move(key).value();
    }

    const auto& args = config.positional();
    const std::string& command = args[0];
    LOG_INFO(core::LogCategory::CLI,
             "running " + command + " on network " + config.network());

    if (command == "checksum") return cmd_checksum(args);
    if (command == "parse")    return cmd_parse(args, *params, blinder);
    if (command == "script")   return cmd_script(args);
    if (command == "classify") return cmd_classify(args);

    print_usage();
    return fail("unknown command: " + command);
}
