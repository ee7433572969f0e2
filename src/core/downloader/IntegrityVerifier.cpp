/**
 * IntegrityVerifier.cpp
 */

#include "IntegrityVerifier.hpp"
#include "Errors.hpp"
#include "../../utils/HashUtils.hpp"
#include "../../utils/StringUtils.hpp"

namespace bulkfetch::core::downloader {

std::string IntegrityVerifier::digest(const std::filesystem::path& file, const std::string& expected) {
    std::optional<std::string> result;
    switch (expected.size()) {
        case 40: result = utils::HashUtils::sha1File(file.string()); break;
        case 64: result = utils::HashUtils::sha256File(file.string()); break;
        default: result = utils::HashUtils::md5File(file.string()); break;
    }
    if (!result) {
        throw LocalIOError("cannot read " + file.string() + " for hashing");
    }
    return *result;
}

bool IntegrityVerifier::matches(const std::filesystem::path& file, const std::string& expected) {
    return utils::StringUtils::equalsIgnoreCase(digest(file, expected), expected);
}

void IntegrityVerifier::verify(const std::filesystem::path& file, const std::string& expected) {
    std::string actual = digest(file, expected);
    if (!utils::StringUtils::equalsIgnoreCase(actual, expected)) {
        throw IntegrityMismatch(expected, actual);
    }
}

} // namespace bulkfetch::core::downloader
