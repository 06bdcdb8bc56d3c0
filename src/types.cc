#include <finbot/types.h>

namespace finbot
{
    Passage ToPassage(const SourceRecord &record)
    {
        Passage p;
        p.content = record.content;
        p.source = record.source;
        p.category = record.category;
        p.sheet_name = record.sheet_name;
        if (record.question)
            p.extra["question"] = *record.question;
        if (record.answer)
            p.extra["answer"] = *record.answer;
        return p;
    }
} // namespace finbot
