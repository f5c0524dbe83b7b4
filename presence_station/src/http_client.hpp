#ifndef HTTP_CLIENT_HPP
#define HTTP_CLIENT_HPP

#include <string>

/* Escape a string to be placed between double quotes in a JSON document */
std::string json_escape(const std::string &s);

/**
 * @brief POST a JSON document
 *
 * curl_global_init must have been called by the program.
 *
 * @param url
 * @param json
 * @param timeout_s bound for the whole request
 * @param[out] status HTTP status code, 0 if no response was received
 * @return false on transport error
 */
bool post_json(const std::string &url, const std::string &json, unsigned int timeout_s, long &status);

#endif
