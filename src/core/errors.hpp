#ifndef PIISHIELD_CORE_ERRORS_HPP
#define PIISHIELD_CORE_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace piishield {
namespace core {

/*
  Error taxonomy
  --------------------------------
  - Checksum/format failures are not exceptions: validators return false and
    the candidate is dropped where it was produced.
  - ExtractionError: one extractor (or the recognizer behind it) failed on one
    string. The pipeline records it on that string's Result and carries on.
  - ProviderUnavailable: a required collaborator (recognizer, scorer, lexicon)
    cannot be set up. Raised from pipeline construction.
  - InputError: the caller handed in an empty batch.
*/

class InputError : public std::invalid_argument
{
public:
    explicit InputError(const std::string &what)
        : std::invalid_argument(what)
    {
    }
};

class ProviderUnavailable : public std::runtime_error
{
public:
    explicit ProviderUnavailable(const std::string &what)
        : std::runtime_error(what)
    {
    }
};

class ExtractionError : public std::runtime_error
{
public:
    ExtractionError(const std::string &source, const std::string &what)
        : std::runtime_error(source + ": " + what)
        , source_(source)
    {
    }

    const std::string &source() const { return source_; }

private:
    std::string source_;
};

} // namespace core
} // namespace piishield

#endif // PIISHIELD_CORE_ERRORS_HPP
