/**
 * @file TextEncoding.hpp
 * @brief Helpers for text captured from external processes.
 */

#pragma once

#include <string>

namespace localscribe::infrastructure {

class TextEncoding {
public:
    /**
     * @brief Returns @p bytes as valid UTF-8.
     *
     * Well-formed sequences are kept; every byte that does not start or belong to one
     * is replaced by U+FFFD.
     */
    static std::string ToValidUtf8(const std::string& bytes);
};

} // namespace localscribe::infrastructure
