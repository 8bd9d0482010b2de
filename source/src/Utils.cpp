#include "Utils.hpp"

std::string read_from_file(const std::string& path) {
	std::ifstream file(path, std::ios::binary | std::ios::ate);

	if (!file.is_open()) {
		throw std::runtime_error("Could not open file: " + path);
	}

	std::streamsize size = file.tellg();
	file.seekg(0, std::ios::beg);

	std::string data(size, '\0');
	file.read(data.data(), size);

	if (!file) {
		throw std::runtime_error("Could not read file: " + path);
	}

    return data;
}

std::string encode_base64(std::string_view data) {
    static constexpr char alphabet[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

    std::string encoded;
    encoded.reserve(((data.size() + 2) / 3) * 4);

    unsigned buffer = 0;
    int bits = 0;

    for (unsigned char byte: data) {
        buffer = (buffer << 8) | byte;
        bits += 8;
        while (bits >= 6) {
            bits -= 6;
            encoded.push_back(alphabet[(buffer >> bits) & 0x3F]);
        }
    }

    if (bits > 0) {
        buffer <<= (6 - bits);
        encoded.push_back(alphabet[buffer & 0x3F]);
    }

    while (encoded.size() % 4 != 0) encoded.push_back('=');

    return encoded;
}
