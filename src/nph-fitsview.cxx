// Local headers
#include "serve_request.hxx"

// Standard library
#include <iostream>

int main(int argc, char const* const* argv) {
    return fitsview::serve_request(argc, argv, std::cout);
}
