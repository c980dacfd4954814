#include "zapwire/crypto/CodeGenerator.hpp"

#include "zapwire/crypto/Random.hpp"

#include <array>
#include <stdexcept>

namespace zapwire::crypto {

namespace {

constexpr std::array<std::string_view, 338> kWords{
    "able", "acid", "aged", "also", "area", "army", "away", "baby", "back", "ball", "band", "bank",
    "base", "bath", "bear", "beat", "bell", "belt", "best", "bird", "blow", "blue", "boat", "body",
    "bold", "bone", "book", "boot", "born", "boss", "both", "bowl", "bulk", "burn", "bush", "busy",
    "cafe", "cake", "calm", "camp", "card", "care", "cart", "case", "cash", "cast", "cell", "chef",
    "chip", "city", "clay", "clip", "club", "coal", "coat", "code", "cold", "comb", "cone", "cook",
    "cool", "cope", "copy", "cord", "core", "corn", "cost", "crew", "crop", "cube", "cure", "dark",
    "data", "date", "dawn", "deal", "dear", "deck", "deep", "deer", "desk", "dial", "dice", "dish",
    "dock", "dome", "door", "dose", "down", "draw", "drop", "drum", "duck", "dune", "dust", "duty",
    "each", "earn", "east", "easy", "echo", "edge", "epic", "even", "exit", "face", "fact", "fair",
    "fall", "farm", "fast", "fern", "file", "fill", "film", "fine", "fire", "firm", "fish", "five",
    "flag", "flat", "fled", "flow", "foam", "fold", "folk", "food", "foot", "fork", "form", "fort",
    "four", "free", "frog", "fuel", "full", "fund", "gain", "game", "gate", "gear", "gift", "glad",
    "glow", "goal", "gold", "golf", "good", "gown", "grab", "gray", "grid", "grip", "grow", "gulf",
    "hail", "hair", "half", "hall", "hand", "harp", "hawk", "head", "heat", "herb", "hero", "high",
    "hill", "hint", "hive", "hold", "home", "hood", "hook", "hope", "horn", "host", "hour", "huge",
    "hunt", "idea", "inch", "iron", "isle", "jazz", "jump", "jury", "keen", "keep", "kelp", "kind",
    "king", "kite", "knee", "knot", "lace", "lake", "lamp", "land", "lane", "last", "lava", "lawn",
    "leaf", "lean", "lens", "life", "lift", "lime", "line", "link", "lion", "list", "load", "loaf",
    "lock", "loft", "long", "loop", "lord", "lucky", "lunar", "mail", "main", "mango", "maple",
    "march", "mask", "meal", "mild", "milk", "mill", "mint", "mist", "moon", "moss", "moth",
    "navy", "neat", "nest", "news", "nice", "node", "nova", "oak", "oasis", "ocean", "olive",
    "onyx", "opal", "open", "orbit", "otter", "oval", "owl", "page", "palm", "park", "path",
    "peak", "pear", "pine", "pink", "plum", "poem", "polo", "pond", "pony", "pool", "port", "puma",
    "quartz", "quest", "quiet", "radar", "rain", "ramp", "raven", "reef", "rice", "ring", "river",
    "road", "robin", "rock", "roof", "rope", "rose", "ruby", "sage", "sail", "salt", "sand",
    "scout", "seal", "seed", "shell", "ship", "silk", "slate", "snow", "solar", "sonic", "spark",
    "star", "stone", "storm", "sun", "swan", "table", "tango", "tiger", "topaz", "torch", "tower",
    "trail", "tulip", "tuna", "ultra", "umbra", "vapor", "velvet", "vivid", "wagon", "walnut",
    "water", "wave", "whale", "wheat", "willow", "wind", "wolf", "yacht", "yarn", "zebra", "zen",
    "zinc"
};

}  // namespace

std::span<const std::string_view> code_word_list() noexcept {
    return kWords;
}

std::string generate_code(std::size_t word_count) {
    if (word_count == 0 || word_count > 16) {
        throw std::invalid_argument("word count must be between 1 and 16");
    }
    std::string code;
    for (std::size_t index = 0; index < word_count; ++index) {
        if (index > 0) {
            code.push_back('-');
        }
        code.append(kWords[random_below(static_cast<std::uint32_t>(kWords.size()))]);
    }
    return code;
}

}  // namespace zapwire::crypto
