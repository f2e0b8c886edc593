#include "ksau/remote_path.hpp"

#include <cctype>

namespace ksau
{

    namespace
    {

        bool is_unreserved(unsigned char ch)
        {
            return std::isalnum(ch) != 0 || ch == '-' || ch == '_' || ch == '.' || ch == '~';
        }

        void append_segments(std::string &out, std::string_view part)
        {
            std::size_t pos = 0;
            while (pos <= part.size())
            {
                const auto slash = part.find('/', pos);
                const auto end = slash == std::string_view::npos ? part.size() : slash;
                if (end > pos)
                {
                    if (!out.empty())
                    {
                        out.push_back('/');
                    }
                    out.append(part.substr(pos, end - pos));
                }
                if (slash == std::string_view::npos)
                {
                    break;
                }
                pos = slash + 1;
            }
        }

        std::string encode(std::string_view value, bool keep_slash)
        {
            static constexpr char kHexDigits[] = "0123456789ABCDEF";
            std::string out;
            out.reserve(value.size());
            for (const char ch : value)
            {
                const auto c = static_cast<unsigned char>(ch);
                if (is_unreserved(c) || (keep_slash && c == '/'))
                {
                    out.push_back(ch);
                    continue;
                }
                out.push_back('%');
                out.push_back(kHexDigits[(c >> 4) & 0x0F]);
                out.push_back(kHexDigits[c & 0x0F]);
            }
            return out;
        }

    } // namespace

    std::string join_remote_path(std::initializer_list<std::string_view> parts)
    {
        std::string out;
        for (const auto part : parts)
        {
            append_segments(out, part);
        }
        return out;
    }

    std::string normalize_remote(std::string_view path)
    {
        return join_remote_path({path});
    }

    std::string url_encode(std::string_view value)
    {
        return encode(value, false);
    }

    std::string url_encode_path(std::string_view path)
    {
        return encode(path, true);
    }

    std::string strip_query(std::string_view url)
    {
        const auto pos = url.find('?');
        return std::string(url.substr(0, pos));
    }

} // namespace ksau
