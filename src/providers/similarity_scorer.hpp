#ifndef PIISHIELD_PROVIDERS_SIMILARITY_SCORER_HPP
#define PIISHIELD_PROVIDERS_SIMILARITY_SCORER_HPP

#include <string>
#include <vector>

namespace piishield {
namespace providers {

/**
 * @class SimilarityScorer
 * @brief Scores how close a context window is to a reference corpus.
 *
 * similarity() must return a value in [0,1] and must not depend on anything
 * but its two arguments. Implementations are called from worker threads
 * concurrently.
 */
class SimilarityScorer
{
public:
    virtual ~SimilarityScorer() = default;

    virtual std::string name() const = 0;

    virtual double similarity(const std::string &window,
                              const std::vector<std::string> &corpus) const = 0;
};

} // namespace providers
} // namespace piishield

#endif // PIISHIELD_PROVIDERS_SIMILARITY_SCORER_HPP
