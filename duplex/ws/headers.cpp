#include "headers.hpp"
#include <boost/algorithm/string/predicate.hpp>

namespace duplex::ws {

    headers::headers(std::initializer_list<std::pair<std::string, std::string>> init) {
        for (const auto& header : init) {
            set_header(header.first, header.second);
        }
    }

    headers::headers(const std::map<std::string, std::string>& init) {
        for (const auto& header : init) {
            set_header(header.first, header.second);
        }
    }

    void headers::set_header(std::string key, std::string value){
        if(key.empty()) return;
        for(auto & header : headers_)
        {
            if(is_header(header.first, key)){
                header.first = std::move(key);
                header.second = std::move(value);
                return;
            }
        }
        headers_.emplace_back(std::move(key), std::move(value));
    }

    void headers::remove_header(std::string_view key){
        std::erase_if(headers_, [key](const auto& header){
            return is_header(header.first, key);
        });
    }

    bool headers::has_header(std::string_view key) const{
        for(const auto& header : headers_){
            if(is_header(header.first, key)) return true;
        }
        return false;
    }

    const std::string& headers::get_header(std::string_view key) const{
        static const std::string empty;
        for(const auto& header : headers_){
            if(is_header(header.first, key)) return header.second;
        }
        return empty;
    }

    void headers::merge(const headers& other){
        for(const auto& header : other.headers_){
            set_header(header.first, header.second);
        }
    }

    bool headers::is_header(std::string_view key, std::string_view header){
        return boost::iequals(key, header);
    }

}
