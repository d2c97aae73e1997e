#pragma once

#include <stdexcept>
#include <string>

namespace wildsort {

// Run-level: a threshold value is out of range
class invalid_policy : public std::runtime_error {
public:
    explicit invalid_policy(const std::string &what)
        : std::runtime_error(what) {}
};

// Run-level: unreadable/incomplete configuration or an unusable run setup
class configuration_error : public std::runtime_error {
public:
    explicit configuration_error(const std::string &what)
        : std::runtime_error(what) {}
};

// Per frame or per file
class detector_failure : public std::runtime_error {
public:
    explicit detector_failure(const std::string &what)
        : std::runtime_error(what) {}
};

// Per file
class destination_exists : public std::runtime_error {
public:
    explicit destination_exists(const std::string &what)
        : std::runtime_error(what) {}
};

// Per file
class move_failed : public std::runtime_error {
public:
    explicit move_failed(const std::string &what)
        : std::runtime_error(what) {}
};

}
