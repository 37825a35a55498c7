#include "checkpoint/Store.hpp"
#include "crypto/util/hash.hpp"

std::string ts::checkpoint::instanceKey(const std::string& host,
                                        const std::filesystem::path& path,
                                        const std::filesystem::path& destination) {
    return crypto::hash::blake2bOf(host + "|" + path.string() + "|" + "=>" + "|" + destination.string());
}
