#ifndef PIISHIELD_PROVIDERS_GAZETTEER_RECOGNIZER_HPP
#define PIISHIELD_PROVIDERS_GAZETTEER_RECOGNIZER_HPP

#include <cstddef>
#include <fstream>
#include <set>
#include <string>
#include <utility>
#include <vector>
#include "entity_recognizer.hpp"
#include "../core/errors.hpp"
#include "../util/logger.hpp"
#include "../util/text_utils.hpp"

/**
 * @file gazetteer_recognizer.hpp
 * @brief Lexicon and rule based entity recognizer for German text.
 *
 * DESIGN GOALS:
 *   - Lets the batch driver run without a statistical model. Any other
 *     EntityRecognizer can replace it.
 *   - Rules, in order:
 *       1. title ("Herr", "Frau", "Dr.", "Prof.", "Anwalt", ...) followed by
 *          one or two capitalised words              -> PER, 0.90
 *       2. known first name followed by a capitalised
 *          word                                       -> PER, 0.85
 *       3. known city                                 -> LOC, 0.90
 *       4. known condition / medication / procedure   -> MED_*, 0.80
 *   - Person spans include the title; the EntityExtractor strips it when
 *     configured to.
 *   - Lexicons are immutable after construction, so recognize() is safe to
 *     call concurrently.
 *
 * USAGE EXAMPLE:
 *   @code
 *   GazetteerRecognizer recognizer;   // built-in lexicons
 *   auto entities = recognizer.recognize("Olaf Scholz und Robert Habeck waren heute in Berlin.");
 *   // PER "Olaf Scholz", PER "Robert Habeck", LOC "Berlin"
 *   @endcode
 */

namespace piishield {
namespace providers {

/**
 * @struct GazetteerLexicon
 * @brief Word lists used by GazetteerRecognizer.
 *
 * Names, cities and titles are matched case-sensitively, medical terms
 * case-insensitively (they are stored lowercased).
 */
struct GazetteerLexicon
{
    std::set<std::string> firstNames;
    std::set<std::string> cities;
    std::set<std::string> conditions;
    std::set<std::string> medications;
    std::set<std::string> procedures;
    std::set<std::string> titles;       ///< Without trailing '.'

    static GazetteerLexicon defaults()
    {
        GazetteerLexicon lex;
        lex.firstNames = {
            "Max", "Moritz", "Anna", "Olaf", "Robert", "Angela", "Peter", "Thomas",
            "Michael", "Andreas", "Stefan", "Maria", "Julia", "Laura", "Sophie",
            "Lukas", "Paul", "Felix", "Jonas", "Leon", "Emma", "Hannah", "Mia",
            "Lena", "Sarah", "Klaus", "J\xC3\xBCrgen", "Wolfgang", "Ursula",
            "Sabine", "Monika", "Petra", "Frank", "Markus", "Christian", "Daniel",
            "Alexander", "Katharina", "Johannes", "Erika", "Heinz", "Helga",
            "Friedrich", "Karl", "Anke", "Lars", "Jan", "Tim", "Nina", "Lisa",
            "Ojaswini"
        };
        lex.cities = {
            "Berlin", "Hamburg", "M\xC3\xBCnchen", "K\xC3\xB6ln", "Frankfurt",
            "Stuttgart", "D\xC3\xBCsseldorf", "Leipzig", "Dortmund", "Essen",
            "Bremen", "Dresden", "Hannover", "N\xC3\xBCrnberg", "Bonn", "Mainz",
            "Kiel", "Potsdam", "Heidelberg", "Freiburg", "Augsburg", "Wiesbaden",
            "Rostock", "Magdeburg", "Erfurt", "Saarbr\xC3\xBC" "cken"
        };
        lex.conditions = {
            "diabetes", "migr\xC3\xA4ne", "asthma", "krebs", "depression",
            "bluthochdruck", "grippe", "demenz", "epilepsie", "rheuma",
            "arthrose", "herzinsuffizienz", "tuberkulose", "hepatitis",
            "schlaganfall", "herzinfarkt", "allergie", "neurodermitis"
        };
        lex.medications = {
            "insulin", "aspirin", "ibuprofen", "paracetamol", "metformin",
            "ramipril", "simvastatin", "omeprazol", "pantoprazol", "amoxicillin",
            "diclofenac", "novaminsulfon", "cortison", "methotrexat", "heparin"
        };
        lex.procedures = {
            "mrt", "ct", "blutabnahme", "r\xC3\xB6ntgen", "operation",
            "chemotherapie", "dialyse", "impfung", "ultraschall", "endoskopie",
            "koloskopie", "physiotherapie", "biopsie", "ekg"
        };
        lex.titles = {
            "Herr", "Herrn", "Frau", "Dr", "Prof", "Anwalt", "Anw\xC3\xA4ltin",
            "Rechtsanwalt", "Rechtsanw\xC3\xA4ltin", "Notar", "Notarin"
        };
        return lex;
    }

    /**
     * @brief Load every list from @p directory (one entry per line, '#'
     *        comments): first_names.txt, cities.txt, conditions.txt,
     *        medications.txt, procedures.txt, titles.txt.
     * @throw core::ProviderUnavailable if a file is missing or unreadable.
     */
    static GazetteerLexicon loadFromDirectory(const std::string &directory)
    {
        GazetteerLexicon lex;
        lex.firstNames = readList(directory + "/first_names.txt", false);
        lex.cities = readList(directory + "/cities.txt", false);
        lex.conditions = readList(directory + "/conditions.txt", true);
        lex.medications = readList(directory + "/medications.txt", true);
        lex.procedures = readList(directory + "/procedures.txt", true);
        lex.titles = readList(directory + "/titles.txt", false);
        return lex;
    }

private:
    static std::set<std::string> readList(const std::string &path, bool lowercase)
    {
        std::ifstream in(path);
        if (!in.is_open()) {
            throw core::ProviderUnavailable("GazetteerLexicon: cannot open " + path);
        }
        std::set<std::string> entries;
        std::string line;
        while (std::getline(in, line)) {
            std::string entry = util::text::trim(line);
            if (entry.empty() || entry[0] == '#') {
                continue;
            }
            if (entry.back() == '.') {
                entry.pop_back();
            }
            entries.insert(lowercase ? util::text::toLower(entry) : entry);
        }
        if (in.bad()) {
            throw core::ProviderUnavailable("GazetteerLexicon: read error in " + path);
        }
        return entries;
    }
};

class GazetteerRecognizer : public EntityRecognizer
{
public:
    static constexpr double TITLED_PERSON_SCORE = 0.90;
    static constexpr double NAMED_PERSON_SCORE = 0.85;
    static constexpr double CITY_SCORE = 0.90;
    static constexpr double MEDICAL_SCORE = 0.80;

    explicit GazetteerRecognizer(GazetteerLexicon lexicon = GazetteerLexicon::defaults())
        : lexicon_(std::move(lexicon))
    {
        util::logger::info("GazetteerRecognizer: " + std::to_string(lexicon_.firstNames.size())
            + " first names, " + std::to_string(lexicon_.cities.size()) + " cities, "
            + std::to_string(lexicon_.conditions.size() + lexicon_.medications.size()
                             + lexicon_.procedures.size()) + " medical terms");
    }

    std::string name() const override { return "gazetteer"; }

    bool isThreadSafe() const override { return true; }

    std::vector<RecognizedEntity> recognize(const std::string &text) const override
    {
        std::vector<RecognizedEntity> entities;
        std::vector<util::text::WordSpan> words = util::text::wordSpans(text);

        std::size_t i = 0;
        while (i < words.size()) {
            std::size_t next = matchPerson(text, words, i, entities);
            if (next > i) {
                i = next;
                continue;
            }
            matchLexicons(words[i], entities);
            ++i;
        }
        return entities;
    }

private:
    /**
     * @brief Rules 1 and 2 starting at words[i].
     * @return Index after the matched person, or i if nothing matched.
     */
    std::size_t matchPerson(const std::string &text,
                            const std::vector<util::text::WordSpan> &words,
                            std::size_t i,
                            std::vector<RecognizedEntity> &entities) const
    {
        // Rule 1: one or more titles ("Prof. Dr.") then up to two names.
        std::size_t j = i;
        while (j < words.size() && lexicon_.titles.count(words[j].text) > 0
               && (j == i || joinedBySpace(text, words[j - 1], words[j], true))) {
            ++j;
        }
        if (j > i) {
            std::size_t last = extendNames(text, words, j, 2, true);
            if (last > j) {
                entities.push_back({words[i].start, words[last - 1].end, "PER", TITLED_PERSON_SCORE});
                return last;
            }
            return i;
        }

        // Rule 2: known first name followed by a capitalised surname.
        if (lexicon_.firstNames.count(words[i].text) > 0) {
            std::size_t last = extendNames(text, words, i + 1, 1, false);
            if (last > i + 1) {
                entities.push_back({words[i].start, words[last - 1].end, "PER", NAMED_PERSON_SCORE});
                return last;
            }
        }
        return i;
    }

    /**
     * @brief Consume up to @p maxNames capitalised words from words[from],
     *        each separated from its predecessor by whitespace (or glued by
     *        '-' for double names). Titles and cities end the run.
     *        @p afterTitle lets the first name follow an abbreviated title ("Dr. Weber").
     */
    std::size_t extendNames(const std::string &text,
                            const std::vector<util::text::WordSpan> &words,
                            std::size_t from,
                            std::size_t maxNames,
                            bool afterTitle) const
    {
        std::size_t k = from;
        std::size_t names = 0;
        while (k < words.size() && names < maxNames) {
            const auto &w = words[k];
            if (!util::text::startsUppercase(text, w.start) || lexicon_.titles.count(w.text) > 0
                || lexicon_.cities.count(w.text) > 0) {
                break;
            }
            if (k == 0 || !joinedBySpace(text, words[k - 1], w, afterTitle && k == from)) {
                break;
            }
            ++k;
            ++names;
            // Double names: "Müller-Lüdenscheidt".
            while (k < words.size() && words[k].start == words[k - 1].end + 1
                   && text[words[k - 1].end] == '-' && util::text::startsUppercase(text, words[k].start)) {
                ++k;
            }
        }
        return k;
    }

    // Only whitespace between the two words, optionally after a '.' when @p allowDot.
    static bool joinedBySpace(const std::string &text,
                              const util::text::WordSpan &prev,
                              const util::text::WordSpan &next,
                              bool allowDot)
    {
        std::size_t p = prev.end;
        if (allowDot && p < next.start && text[p] == '.') {
            ++p;
        }
        if (p >= next.start) {
            return false;
        }
        for (; p < next.start; ++p) {
            if (!util::text::isSpace(text[p])) {
                return false;
            }
        }
        return true;
    }

    void matchLexicons(const util::text::WordSpan &word, std::vector<RecognizedEntity> &entities) const
    {
        if (lexicon_.cities.count(word.text) > 0) {
            entities.push_back({word.start, word.end, "LOC", CITY_SCORE});
            return;
        }
        std::string lowered = util::text::toLower(word.text);
        if (lexicon_.conditions.count(lowered) > 0) {
            entities.push_back({word.start, word.end, "MED_CONDITION", MEDICAL_SCORE});
        } else if (lexicon_.medications.count(lowered) > 0) {
            entities.push_back({word.start, word.end, "MED_MEDICATION", MEDICAL_SCORE});
        } else if (lexicon_.procedures.count(lowered) > 0) {
            entities.push_back({word.start, word.end, "MED_PROCEDURE", MEDICAL_SCORE});
        }
    }

    GazetteerLexicon lexicon_;
};

} // namespace providers
} // namespace piishield

#endif // PIISHIELD_PROVIDERS_GAZETTEER_RECOGNIZER_HPP
