// src/staging_records.cpp
#include "staging_records.hpp"
#include <iomanip> // For std::setw, std::setfill
#include <sstream>

namespace PageStitch
{
    namespace Records
    {

        bool Manifest::operator==(const Manifest &other) const
        {
            return version == other.version &&
                   source_mtime == other.source_mtime &&
                   source_size == other.source_size &&
                   total_pages == other.total_pages &&
                   pages_per_chunk == other.pages_per_chunk &&
                   max_pages == other.max_pages &&
                   model_id == other.model_id &&
                   num_chunks == other.num_chunks;
        }

        void to_json(nlohmann::json &j, const Manifest &m)
        {
            j = nlohmann::json
            {
                {"version", m.version},
                {"pdf_mtime", m.source_mtime},
                {"pdf_size", m.source_size},
                {"total_pages", m.total_pages},
                {"pages_per_chunk", m.pages_per_chunk},
                {"max_pages", nullptr},
                {"model_id", m.model_id},
                {"num_chunks", m.num_chunks}
            };
            if (m.max_pages)
            {
                j["max_pages"] = *m.max_pages;
            }
        }

        void from_json(const nlohmann::json &j, Manifest &m)
        {
            j.at("version").get_to(m.version);
            j.at("pdf_mtime").get_to(m.source_mtime);
            j.at("pdf_size").get_to(m.source_size);
            j.at("total_pages").get_to(m.total_pages);
            j.at("pages_per_chunk").get_to(m.pages_per_chunk);
            const auto &cap = j.at("max_pages");
            if (cap.is_null())
            {
                m.max_pages.reset();
            }
            else
            {
                m.max_pages = cap.get<int>();
            }
            j.at("model_id").get_to(m.model_id);
            j.at("num_chunks").get_to(m.num_chunks);
        }

        void to_json(nlohmann::json &j, const ChunkUsage &u)
        {
            j = nlohmann::json
            {
                {"index", u.index},
                {"page_start", u.page_start},
                {"page_end", u.page_end},
                {"input_tokens", u.input_tokens},
                {"output_tokens", u.output_tokens},
                {"cache_creation_tokens", u.cache_creation_tokens},
                {"cache_read_tokens", u.cache_read_tokens},
                {"cost", u.cost},
                {"elapsed_seconds", u.elapsed_seconds},
                {"payload_sha256", u.payload_sha256}
            };
        }

        void from_json(const nlohmann::json &j, ChunkUsage &u)
        {
            j.at("index").get_to(u.index);
            j.at("page_start").get_to(u.page_start);
            j.at("page_end").get_to(u.page_end);
            j.at("input_tokens").get_to(u.input_tokens);
            j.at("output_tokens").get_to(u.output_tokens);
            j.at("cache_creation_tokens").get_to(u.cache_creation_tokens);
            j.at("cache_read_tokens").get_to(u.cache_read_tokens);
            j.at("cost").get_to(u.cost);
            j.at("elapsed_seconds").get_to(u.elapsed_seconds);
            u.payload_sha256 = j.value("payload_sha256", std::string());
        }

        void to_json(nlohmann::json &j, const DocumentStats &s)
        {
            j = nlohmann::json
            {
                {"doc_name", s.doc_name},
                {"pages", s.pages},
                {"chunks", s.chunks},
                {"input_tokens", s.input_tokens},
                {"output_tokens", s.output_tokens},
                {"cache_creation_tokens", s.cache_creation_tokens},
                {"cache_read_tokens", s.cache_read_tokens},
                {"cost", s.cost},
                {"elapsed_seconds", s.elapsed_seconds}
            };
        }

        void from_json(const nlohmann::json &j, DocumentStats &s)
        {
            j.at("doc_name").get_to(s.doc_name);
            j.at("pages").get_to(s.pages);
            j.at("chunks").get_to(s.chunks);
            j.at("input_tokens").get_to(s.input_tokens);
            j.at("output_tokens").get_to(s.output_tokens);
            j.at("cache_creation_tokens").get_to(s.cache_creation_tokens);
            j.at("cache_read_tokens").get_to(s.cache_read_tokens);
            j.at("cost").get_to(s.cost);
            j.at("elapsed_seconds").get_to(s.elapsed_seconds);
        }

        std::string formatDuration(double seconds)
        {
            if (seconds < 0)
            {
                return "0s";
            }
            long s = static_cast<long>(seconds);
            std::ostringstream ss;
            if (s < 60)
            {
                ss << s << "s";
                return ss.str();
            }
            long m = s / 60;
            s %= 60;
            if (m < 60)
            {
                ss << m << "m " << std::setw(2) << std::setfill('0') << s << "s";
                return ss.str();
            }
            long h = m / 60;
            m %= 60;
            ss << h << "h " << std::setw(2) << std::setfill('0') << m << "m "
               << std::setw(2) << std::setfill('0') << s << "s";
            return ss.str();
        }

    } // namespace Records
} // namespace PageStitch
