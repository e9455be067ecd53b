#pragma once

#include <string>
#include <string_view>

namespace http {

inline bool is_gcs_path(std::string_view url)
{
    return url.starts_with("gs://") || url.starts_with("gcs://");
}

inline bool is_http_path(std::string_view url)
{
    return url.starts_with("http://") || url.starts_with("https://");
}

inline bool is_file_url(std::string_view url)
{
    return url.starts_with("file://");
}

/**
 * @brief Strips the `scheme://` part of a url.
 */
inline std::string strip_scheme(const std::string& url)
{
    auto pos = url.find("://");
    if (pos == std::string::npos) {
        return url;
    }
    return url.substr(pos + 3);
}

} // namespace http
