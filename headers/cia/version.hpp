#ifndef CIA_VERSION_HPP
#define CIA_VERSION_HPP

/**
 * @file version.hpp
 * @brief Change Impact Analyzer version information.
 */

namespace cia {

    constexpr int VERSION_MAJOR = 1;
    constexpr int VERSION_MINOR = 0;
    constexpr int VERSION_PATCH = 0;

    constexpr auto VERSION_STRING = "1.0.0";

    constexpr auto PROJECT_NAME = "Change Impact Analyzer";

    constexpr auto PROJECT_SHORT_NAME = "cia";

}  // namespace cia

#endif //CIA_VERSION_HPP
