#include "coinjecture/codec.hpp"
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <string>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    std::string text(reinterpret_cast<const char*>(data), size);
    auto header = coinjecture::codec::header_from_json(text);
    if (!header) {
        return 0;
    }

    // Interchange round trip must preserve the canonical bytes
    auto again = coinjecture::codec::header_from_json(coinjecture::codec::header_to_json(*header));
    if (!again || coinjecture::codec::encode_header(*again) != coinjecture::codec::encode_header(*header)) {
        std::abort();
    }
    return 0;
}
