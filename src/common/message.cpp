#include <algorithm>
#include <cctype>
#include <cstring>
#include <string>
#include <vector>

#include <boost/algorithm/string.hpp>

#include "message.h"

namespace maxpy_debugger::serialization
{

message make_message(std::string content)
{
    message msg;
    msg.header_ = content_header + std::to_string(content.size()) + "\r\n\r\n";
    msg.content_ = std::move(content);
    return msg;
}

std::string frame(const std::string& content)
{
    return content_header + std::to_string(content.size()) + "\r\n\r\n" + content;
}

void frame_reader::feed(const char* data, std::size_t len)
{
    buffer_.append(data, len);
}

// Consume one header block from the front of the buffer, if one is complete. Header lines other
// than Content-Length are allowed by the base protocol and are skipped.
bool frame_reader::parse_header()
{
    auto end = buffer_.find("\r\n\r\n");
    if (end == std::string::npos)
        return false;

    std::string block = buffer_.substr(0, end);
    buffer_.erase(0, end + 4);

    std::vector<std::string> lines;
    boost::algorithm::split(lines, block, boost::algorithm::is_any_of("\n"));

    const std::size_t header_len = std::strlen(content_header);
    long long length = -1;

    for (std::string& line : lines)
    {
        boost::algorithm::trim(line);
        if (line.empty())
            continue;

        if (line.size() > header_len && boost::algorithm::istarts_with(line, content_header))
        {
            std::string value = boost::algorithm::trim_copy(line.substr(header_len));
            if (value.empty() || !std::all_of(value.begin(), value.end(), [](char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; }))
            {
                throw protocol_error("Invalid Content-Length header: " + line);
            }

            try
            {
                length = std::stoll(value);
            }
            catch (const std::out_of_range&)
            {
                throw protocol_error("Content-Length out of range: " + line);
            }

            if (length > max_content_length)
            {
                throw protocol_error("Content-Length too large: " + line);
            }
        }
    }

    if (length < 0)
    {
        throw protocol_error("Message header has no Content-Length: " + block);
    }

    pending_length_ = length;
    return true;
}

std::size_t frame_reader::wanted() const
{
    if (pending_length_ < 0)
        return 1;

    auto length = static_cast<std::size_t>(pending_length_);
    return length > buffer_.size() ? length - buffer_.size() : 1;
}

bool frame_reader::next(std::string& content)
{
    if (pending_length_ < 0 && !parse_header())
        return false;

    if (buffer_.size() < static_cast<std::size_t>(pending_length_))
        return false;

    content = buffer_.substr(0, static_cast<std::size_t>(pending_length_));
    buffer_.erase(0, static_cast<std::size_t>(pending_length_));
    pending_length_ = -1;
    return true;
}

}
