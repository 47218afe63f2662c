#include "coinjecture/codec.hpp"
#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <cstdlib>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    auto header = coinjecture::codec::decode_header(data, size);
    if (!header) {
        return 0;
    }

    // A strict decode must re-encode to the same bytes
    auto encoded = coinjecture::codec::encode_header(*header);
    if (!encoded || encoded->size() != size ||
        !std::equal(encoded->begin(), encoded->end(), data)) {
        std::abort();
    }
    return 0;
}
