// Copyright (c) 2024-2026 The ELMS Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

// libFuzzer harness: any string that parses as a pre-taproot descriptor
// must print to a string that parses back to the same descriptor.

#include "core/logging.h"
#include "descriptor/pretaproot.h"

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <string_view>

extern "C" int LLVMFuzzerInitialize(int* /*argc*/, char*** /*argv*/) {
    core::Logger::instance().set_level(core::LogLevel::OFF);
    return 0;
}

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const std::string_view input(reinterpret_cast<const char*>(data), size);
    auto result = descriptor::roundtrip_descriptor(input);
    if (!result) {
        std::cerr << "round trip failed for \"" << input
                  << "\": " << result.error().message() << "\n";
        std::abort();
    }
    return 0;
}
