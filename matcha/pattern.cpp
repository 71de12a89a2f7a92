#include "pattern.hpp"

namespace Matcha {

bool match(string_view pattern, string_view text)
{
	return Pattern(pattern).match(text);
}

std::optional<string> find(string_view pattern, string_view text)
{
	if (auto m = Pattern(pattern).find(text); m) {
		return std::move(m->value);
	}
	return std::nullopt;
}

std::vector<string> find_all(string_view pattern, string_view text)
{
	std::vector<string> values;
	for (auto& m : Pattern(pattern).find_all(text)) {
		values.push_back(std::move(m.value));
	}
	return values;
}

} // namespace Matcha
