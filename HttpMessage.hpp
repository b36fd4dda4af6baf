#if !defined HTTP_MESSAGE_HPP
#define HTTP_MESSAGE_HPP

#include <boost/beast/http.hpp>

// Messages exchanged between the relay client and the relay gateway.  Every exchange is one
// request per connection with the whole body held in memory.
typedef boost::beast::http::request<boost::beast::http::string_body>  HttpRequest;
typedef boost::beast::http::response<boost::beast::http::string_body> HttpResponse;

#endif
