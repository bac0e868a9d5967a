#pragma once

/**
 * @file id.hpp
 * @brief Identifier generation
 */

#include <string>

namespace esflow {

/**
 * @brief Random (version 4) UUID in canonical 8-4-4-4-12 form
 */
[[nodiscard]] std::string generate_id();

} // namespace esflow
