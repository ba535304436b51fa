// include/markers.hpp
#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace PageStitch
{
    namespace Markers
    {

        // HTML-comment sentinels embedded in converted markdown.
        //   <!-- PDF_PAGE_BEGIN 42 --> ... <!-- PDF_PAGE_END 42 -->
        //   <!-- TABLE_CONTINUE -->  placed before a table continuing the previous one
        // Page numbers are always original document page numbers. At most nine
        // digits are read, so a page number of ten or more digits does not
        // form a sentinel and is left as an ordinary comment.
        extern const std::string PAGE_BEGIN_TAG;
        extern const std::string PAGE_END_TAG;
        extern const std::string TABLE_CONTINUE;

        std::string formatPageBegin(int page);
        std::string formatPageEnd(int page);

        // One sentinel found in a text. page is 0 for valueless sentinels.
        struct MarkerMatch
        {
            std::size_t offset;
            std::size_t length;
            int page;
        };

        // All matches in document order. Whitespace inside the comment is
        // tolerated ("<!--PDF_PAGE_BEGIN   7-->" is recognized).
        std::vector<MarkerMatch> findPageBegins(const std::string &text);
        std::vector<MarkerMatch> findPageEnds(const std::string &text);
        std::vector<MarkerMatch> findContinueMarkers(const std::string &text);

        // Page begin and end sentinels together, in document order. Several
        // sentinels sharing one line are reported separately.
        std::vector<MarkerMatch> findPageMarkers(const std::string &text);

        // Remap page sentinels that use sub-document viewer numbering
        // (restarting at 1 for every chunk) to original page numbers.
        // If the first PAGE_BEGIN is below page_start, page_start - 1 is added
        // to every PAGE_BEGIN and PAGE_END; otherwise the text is returned
        // unchanged.
        std::string remapPageMarkers(const std::string &text, int page_start);

        // Strip leading and trailing whitespace
        std::string trim(const std::string &s);

    } // namespace Markers
} // namespace PageStitch
