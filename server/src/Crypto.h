#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace FleetNet {

	constexpr size_t kSessionSecretSize = 32;
	using SessionSecret = std::array<uint8_t, kSessionSecretSize>;

	SessionSecret GenerateSessionSecret();
	// 16 random bytes as 32 lowercase hex digits.
	std::string GenerateConnectionId();

	std::string EncodeBase64(const uint8_t* data, size_t size);
	bool DecodeBase64(const std::string& text, std::vector<uint8_t>& out);

} // namespace FleetNet
