#ifndef CIA_ALL_EXTRACTORS_HPP
#define CIA_ALL_EXTRACTORS_HPP

/**
 * @file all_extractors.hpp
 * @brief Includes and registers all built-in symbol extractors.
 */

#include "cia/extractors/go_extractor.hpp"
#include "cia/extractors/typescript_extractor.hpp"
#include "cia/extractors/python_extractor.hpp"
#include "cia/extractors/rust_extractor.hpp"
#include "cia/extractors/java_extractor.hpp"

namespace cia::extractors {

    /**
     * Registers every built-in extractor with @p registry.
     *
     * ExtractorRegistry::instance() does this on first use; call it
     * directly only to restore the built-ins after replacing one.
     */
    inline void register_builtin_extractors(ExtractorRegistry& registry) {
        register_go_extractor(registry);
        register_typescript_extractors(registry);
        register_python_extractor(registry);
        register_rust_extractor(registry);
        register_java_extractor(registry);
    }

}  // namespace cia::extractors

#endif //CIA_ALL_EXTRACTORS_HPP
