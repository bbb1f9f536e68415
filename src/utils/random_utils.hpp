#pragma once

#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <string>

namespace pidbox {
namespace utils {

// One generator per thread; boost::uuids::random_generator is not thread safe.
inline boost::uuids::random_generator& thread_uuid_generator() {
    static thread_local boost::uuids::random_generator generator;
    return generator;
}

/**
 * @brief Fresh random (version 4) UUID in canonical 36-character form.
 *
 * Used for tickets, delivery tags and reply-channel tokens.
 */
inline std::string random_uuid() {
    return boost::uuids::to_string(thread_uuid_generator()());
}

} // namespace utils
} // namespace pidbox
