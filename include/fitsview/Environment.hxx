#pragma once

// Standard library
#include <map>
#include <string>
#include <vector>

namespace fitsview {
/** Class encapsulating the CGI environment of a request.
 */
class Environment {
public:
    Environment(int argc = 0, char const* const* argv = 0);
    Environment(std::string const& request_method, std::string const& path_info,
                std::string const& query_string,
                std::string const& server_protocol = "HTTP/1.0");
    ~Environment();

    /// \name Server environment
    //@{
    /// Returns the name and version of the protocol (usually @c HTTP/1.0 or @c
    /// HTTP/1.1).
    std::string const& get_server_protocol() const { return server_protocol_; }

    //@}

    /// \name CGI environment
    //@{
    /// Returns the request method, usually @c GET or @c HEAD.
    std::string const& get_request_method() const { return request_method_; }

    /// Returns path information for this request.
    std::string const& get_path_info() const { return path_info_; }

    //@}

    /// \name CGI Parameters
    //@{
    /// Returns the total number of query parameter values.
    size_t get_num_values() const { return kv_map_.size(); }

    /// Returns the number of values for the query parameter with the given name.
    size_t get_num_values(std::string const& key) const { return kv_map_.count(key); }

    /// Returns @c true if a query parameter with the given name exists.
    bool has_key(std::string const& key) const { return get_num_values(key) != 0; }
    std::vector<std::string> const get_keys() const;
    std::string const& get_value(std::string const& key) const;
    std::string get_value_or_default(std::string const& key,
                                     std::string const& def) const;
    std::vector<std::string> const get_values(std::string const& key) const;

    //@}

    /// \name Utilities
    static std::string const url_decode(std::string const& src);

    //@}

private:
    typedef std::multimap<std::string, std::string> KeyValueMap;
    typedef KeyValueMap::const_iterator KeyValueIter;

    // Disable copying and assignment
    Environment(Environment const&) = delete;
    Environment& operator=(Environment const&) = delete;

    void parse_input(std::string const& data);

    std::string server_protocol_;
    std::string request_method_;
    std::string path_info_;
    std::string query_string_;

    KeyValueMap kv_map_;
};
}  // namespace fitsview
