#include "coinjecture/codec.hpp"
#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <cstdlib>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    auto block = coinjecture::codec::decode_block(data, size);
    if (!block) {
        return 0;
    }

    auto encoded = coinjecture::codec::encode_block(*block);
    if (!encoded || encoded->size() != size ||
        !std::equal(encoded->begin(), encoded->end(), data)) {
        std::abort();
    }
    return 0;
}
