#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace App
{
    // Text of settled face values in settle order, "6+3+1". Reset per roll.
    class OutcomeLog
    {
    public:
        void reset();
        void append(size_t die_index, int face);

        // Drops the entry of a die that was knocked off its face.
        void withdraw(size_t die_index);

        const std::string &text() const { return _text; }
        std::vector<int> faces() const;
        bool empty() const { return _entries.empty(); }

    private:
        struct Entry
        {
            size_t die_index;
            int face;
        };

        void rebuild_text();

        std::vector<Entry> _entries;
        std::string _text;
    };
} // namespace App
