#ifndef WORMHOLE_CODES_HPP
#define WORMHOLE_CODES_HPP

#include <cstddef>
#include <string>

namespace Wormhole {

    // Number of words appended to the nameplate in generated codes.
    constexpr size_t CODE_WORD_COUNT = 2;

    /**
     * @brief Builds a code such as "7-guitarist-revenue" from a nameplate and
     * randomly chosen words.
     */
    std::string make_code(const std::string& nameplate, size_t word_count = CODE_WORD_COUNT);

    /**
     * @brief Normalizes a code typed by a human: surrounding whitespace is
     * dropped and inner runs of whitespace become single dashes, so
     * "  7 guitarist revenue " yields "7-guitarist-revenue".
     */
    std::string normalize_code(const std::string& text);

    /**
     * @brief Returns the nameplate, i.e. the leading numeric field, of a code.
     * @throws InvalidArgument if the code does not look like "<digits>-<words>".
     */
    std::string nameplate_of(const std::string& code);

} // namespace Wormhole

#endif // WORMHOLE_CODES_HPP
