#include "zapwire/crypto/CodeGenerator.hpp"

#include <algorithm>
#include <cassert>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

using namespace zapwire::crypto;

namespace {

std::vector<std::string> split(const std::string& code) {
    std::vector<std::string> words;
    std::stringstream stream(code);
    std::string word;
    while (std::getline(stream, word, '-')) {
        words.push_back(word);
    }
    return words;
}

bool in_list(const std::string& word) {
    const auto list = code_word_list();
    return std::find(list.begin(), list.end(), std::string_view(word)) != list.end();
}

}  // namespace

int main() {
    const auto list = code_word_list();
    assert(list.size() >= 256);
    {
        std::set<std::string_view> unique(list.begin(), list.end());
        assert(unique.size() == list.size());
        for (const auto word : list) {
            assert(!word.empty());
            assert(word.find('-') == std::string_view::npos);
        }
    }

    for (std::size_t count = 1; count <= 16; ++count) {
        const auto code = generate_code(count);
        const auto words = split(code);
        assert(words.size() == count);
        for (const auto& word : words) {
            assert(in_list(word));
        }
    }

    // Three words drawn from a few hundred should essentially never repeat.
    {
        std::set<std::string> seen;
        for (int round = 0; round < 50; ++round) {
            seen.insert(generate_code(3));
        }
        assert(seen.size() > 45);
    }

    for (const std::size_t bad : {std::size_t{0}, std::size_t{17}}) {
        bool rejected = false;
        try {
            (void)generate_code(bad);
        } catch (const std::invalid_argument&) {
            rejected = true;
        }
        assert(rejected);
    }

    return 0;
}
