#pragma once

#include "types.hpp"
#include <string>
#include <vector>

namespace anchor
{

    /**
     * Set of trusted calendar URL patterns. A pattern is scheme://netloc/path
     * where the netloc may contain `*` wildcards; scheme and path must match
     * exactly.
     */
    class CalendarWhitelist
    {
    public:
        CalendarWhitelist() = default;

        /**
         * Add a pattern. Without an explicit scheme both the http:// and the
         * https:// forms are trusted.
         */
        Result<void> add(const std::string &url);

        bool contains(const std::string &url) const;

        bool empty() const { return patterns_.empty(); }

        const std::vector<std::string> &patterns() const { return patterns_; }

        /** The well-known public calendar operators */
        static CalendarWhitelist defaults();

    private:
        struct Pattern
        {
            std::string scheme;
            std::string netloc;
            std::string path;
        };

        std::vector<Pattern> parsed_;
        std::vector<std::string> patterns_;
    };

    /** Glob match supporting `*` (any run) and `?` (one character) */
    bool glob_match(const std::string &pattern, const std::string &text);

} // namespace anchor
