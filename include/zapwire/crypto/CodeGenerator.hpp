#pragma once

#include <span>
#include <string>
#include <string_view>

namespace zapwire::crypto {

std::span<const std::string_view> code_word_list() noexcept;

// Words chosen uniformly with the CSPRNG and joined by '-'. word_count must be 1..16.
std::string generate_code(std::size_t word_count);

}  // namespace zapwire::crypto
