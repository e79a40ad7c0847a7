#ifndef PROMPTVAULT_USAGE_LEDGER_H
#define PROMPTVAULT_USAGE_LEDGER_H

#include <vector>
#include <optional>
#include <cstdint>
#include "database.h"
#include "models.h"

namespace promptvault {

// Lowest and highest accepted rating
constexpr int MIN_RATING = 1;
constexpr int MAX_RATING = 5;

// Running mean after adding one rating to (avg, count)
double nextScoreAverage(double avg, int64_t count, int rating);

// Append-only usage log plus the running score on prompts
class UsageLedger {
public:
    explicit UsageLedger(Database& db);

    // Append a usage record; when rated, fold the rating into the prompt's
    // score_avg/score_count. Log row and score update commit together.
    // Throws ValidationError for a rating outside 1-5 (nothing written) and
    // NotFoundError when the prompt does not exist (nothing written).
    void logUsage(const UsageInput& input);

    // Newest first
    std::vector<UsageLog> listUsage(int64_t prompt_id);

private:
    Database& db_;
};

} // namespace promptvault

#endif // PROMPTVAULT_USAGE_LEDGER_H
