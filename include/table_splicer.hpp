// include/table_splicer.hpp
#pragma once

#include <string>
#include <vector>

namespace PageStitch
{
    namespace Merge
    {

        // Outcome of mergeContinuedTables().
        struct SpliceReport
        {
            std::string text;                  // document after splicing
            int merged = 0;                    // continuation tables folded into their predecessor
            int stripped = 0;                  // sentinels inside an open table, removed
            int skipped = 0;                   // sentinels left in place (see warnings)
            int remaining = 0;                 // TABLE_CONTINUE sentinels still in text
            std::vector<std::string> warnings;
        };

        // Merge continuation tables into the tables they continue.
        //
        // A <!-- TABLE_CONTINUE --> sentinel precedes a table whose rows continue
        // the table ending just before the sentinel. Its <tbody> rows are moved
        // into the preceding table's <tbody> (with any page sentinels found between
        // the two tables, so page provenance survives), and the continuation
        // table's <thead>, wrapper, "(continued)" title and the sentinel go away.
        //
        // Sentinels are handled last to first so earlier offsets stay valid.
        // A sentinel inside a table that is still open is simply removed.
        // When the preceding table, its <tbody> or the continuation table cannot be
        // found, the text is left as is and a warning is recorded; this never throws.
        SpliceReport mergeContinuedTables(const std::string &markdown);

    } // namespace Merge
} // namespace PageStitch
