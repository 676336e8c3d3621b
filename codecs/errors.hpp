#ifndef ERRORS_HPP
#define ERRORS_HPP

#include <stdexcept>
#include <string>

#include <cstddef>

// header prefix too short to probe. advisory: the decode still goes ahead
class Format_error: public std::runtime_error
{
public:
    Format_error(const std::string & msg, std::size_t available);
    std::size_t available() const noexcept { return available_; }
private:
    std::size_t available_ {0};
};

// one backend could not make sense of the file. the next backend gets a go
struct Decode_failure: public std::runtime_error
{
    using std::runtime_error::runtime_error;
};

// every backend failed
struct Fatal_decode_error: public std::runtime_error
{
    using std::runtime_error::runtime_error;
};

// the active backend can't do what was asked of it
struct Unsupported_operation: public std::logic_error
{
    using std::logic_error::logic_error;
};

struct Io_error: public std::runtime_error
{
    using std::runtime_error::runtime_error;
};

#endif // ERRORS_HPP
