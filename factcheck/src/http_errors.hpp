#pragma once
#include "upstream_error.hpp"
#include <cpr/cpr.h>
#include <string>

// Throws the UpstreamError matching a failed cpr exchange; returns for 2xx.
void raise_for_response(const cpr::Response& response, const std::string& upstream);

// Pulls a human readable message out of an error body, or the raw text
std::string error_message_from_body(const std::string& body);
