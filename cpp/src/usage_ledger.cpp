#include "usage_ledger.h"
#include "errors.h"
#include "utils.h"
#include <sstream>

namespace promptvault {

double nextScoreAverage(double avg, int64_t count, int rating) {
    if (count <= 0) {
        return static_cast<double>(rating);
    }
    return (avg * static_cast<double>(count) + rating) / static_cast<double>(count + 1);
}

UsageLedger::UsageLedger(Database& db)
    : db_(db)
{
}

void UsageLedger::logUsage(const UsageInput& input) {
    if (input.rating && (*input.rating < MIN_RATING || *input.rating > MAX_RATING)) {
        throw ValidationError("Rating must be between 1 and 5, got " +
                              std::to_string(*input.rating));
    }

    std::string payload = input.input_payload.dump(-1, ' ', false, json::error_handler_t::replace);
    std::string now = utils::getCurrentTimestamp();

    Transaction tx(db_);

    double score_avg = 0.0;
    int64_t score_count = 0;
    {
        Statement select(db_, "SELECT score_avg, score_count FROM prompts WHERE id = ?");
        select.bindInt64(1, input.prompt_id);
        if (!select.step()) {
            throw NotFoundError("Cannot log usage: prompt " + std::to_string(input.prompt_id) +
                                " does not exist");
        }
        score_avg = select.columnDouble(0);
        score_count = select.columnInt64(1);
    }

    Statement insert(db_, R"(
        INSERT INTO usage_logs (prompt_id, input_vars, output_text, rating, used_at)
        VALUES (?, ?, ?, ?, ?)
    )");
    insert.bindInt64(1, input.prompt_id)
          .bindText(2, payload)
          .bindText(3, input.output_text)
          .bindOptionalInt(4, input.rating)
          .bindText(5, now);
    insert.run();

    if (input.rating) {
        double next_avg = nextScoreAverage(score_avg, score_count, *input.rating);
        int64_t next_count = score_count + 1;

        Statement update(db_, R"(
            UPDATE prompts
            SET score_avg = ?, score_count = ?, updated_at = ?
            WHERE id = ?
        )");
        update.bindDouble(1, next_avg)
              .bindInt64(2, next_count)
              .bindText(3, utils::getCurrentTimestamp())
              .bindInt64(4, input.prompt_id);
        update.run();

        std::ostringstream msg;
        msg << "Prompt " << input.prompt_id << " score now " << next_avg
            << " over " << next_count << " ratings";
        utils::log::debug(msg.str());
    }

    tx.commit();
}

std::vector<UsageLog> UsageLedger::listUsage(int64_t prompt_id) {
    std::vector<UsageLog> logs;

    Statement stmt(db_, R"(
        SELECT id, prompt_id, input_vars, output_text, rating, used_at
        FROM usage_logs
        WHERE prompt_id = ?
        ORDER BY used_at DESC, id DESC
    )");
    stmt.bindInt64(1, prompt_id);

    while (stmt.step()) {
        UsageLog entry;
        entry.id = stmt.columnInt64(0);
        entry.prompt_id = stmt.columnInt64(1);
        // Stored payloads are always valid JSON text written by logUsage
        entry.input_payload = json::parse(stmt.columnText(2), nullptr, false);
        entry.output_text = stmt.columnText(3);
        if (!stmt.columnIsNull(4)) {
            entry.rating = static_cast<int>(stmt.columnInt64(4));
        }
        entry.used_at = stmt.columnText(5);
        logs.push_back(entry);
    }

    return logs;
}

} // namespace promptvault
