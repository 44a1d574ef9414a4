/* html_entities.cpp - HTML named character references.
 *
 * epubmeta.
 * Copyright (c) 2025 The epubmeta authors.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "html_entities.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <cstddef>
#include <iterator>
#include <string>
#include <string_view>

namespace epubmeta {
namespace {
struct named_entity {
	std::string_view name;
	char32_t code_point;
};

// U+00A0 to U+00FF, in code point order.
constexpr std::array<std::string_view, 96> latin1_entities = {
	"nbsp", "iexcl", "cent", "pound", "curren", "yen", "brvbar", "sect",
	"uml", "copy", "ordf", "laquo", "not", "shy", "reg", "macr",
	"deg", "plusmn", "sup2", "sup3", "acute", "micro", "para", "middot",
	"cedil", "sup1", "ordm", "raquo", "frac14", "frac12", "frac34", "iquest",
	"Agrave", "Aacute", "Acirc", "Atilde", "Auml", "Aring", "AElig", "Ccedil",
	"Egrave", "Eacute", "Ecirc", "Euml", "Igrave", "Iacute", "Icirc", "Iuml",
	"ETH", "Ntilde", "Ograve", "Oacute", "Ocirc", "Otilde", "Ouml", "times",
	"Oslash", "Ugrave", "Uacute", "Ucirc", "Uuml", "Yacute", "THORN", "szlig",
	"agrave", "aacute", "acirc", "atilde", "auml", "aring", "aelig", "ccedil",
	"egrave", "eacute", "ecirc", "euml", "igrave", "iacute", "icirc", "iuml",
	"eth", "ntilde", "ograve", "oacute", "ocirc", "otilde", "ouml", "divide",
	"oslash", "ugrave", "uacute", "ucirc", "uuml", "yacute", "thorn", "yuml",
};
constexpr char32_t LATIN1_FIRST = 0xA0;

constexpr std::array<named_entity, 152> other_entities = {{
	{"OElig", 338}, {"oelig", 339}, {"Scaron", 352}, {"scaron", 353}, {"Yuml", 376},
	{"fnof", 402}, {"circ", 710}, {"tilde", 732},
	{"Alpha", 913}, {"Beta", 914}, {"Gamma", 915}, {"Delta", 916}, {"Epsilon", 917},
	{"Zeta", 918}, {"Eta", 919}, {"Theta", 920}, {"Iota", 921}, {"Kappa", 922},
	{"Lambda", 923}, {"Mu", 924}, {"Nu", 925}, {"Xi", 926}, {"Omicron", 927},
	{"Pi", 928}, {"Rho", 929}, {"Sigma", 931}, {"Tau", 932}, {"Upsilon", 933},
	{"Phi", 934}, {"Chi", 935}, {"Psi", 936}, {"Omega", 937},
	{"alpha", 945}, {"beta", 946}, {"gamma", 947}, {"delta", 948}, {"epsilon", 949},
	{"zeta", 950}, {"eta", 951}, {"theta", 952}, {"iota", 953}, {"kappa", 954},
	{"lambda", 955}, {"mu", 956}, {"nu", 957}, {"xi", 958}, {"omicron", 959},
	{"pi", 960}, {"rho", 961}, {"sigmaf", 962}, {"sigma", 963}, {"tau", 964},
	{"upsilon", 965}, {"phi", 966}, {"chi", 967}, {"psi", 968}, {"omega", 969},
	{"thetasym", 977}, {"upsih", 978}, {"piv", 982},
	{"ensp", 8194}, {"emsp", 8195}, {"thinsp", 8201}, {"zwnj", 8204}, {"zwj", 8205},
	{"lrm", 8206}, {"rlm", 8207}, {"ndash", 8211}, {"mdash", 8212}, {"lsquo", 8216},
	{"rsquo", 8217}, {"sbquo", 8218}, {"ldquo", 8220}, {"rdquo", 8221}, {"bdquo", 8222},
	{"dagger", 8224}, {"Dagger", 8225}, {"bull", 8226}, {"hellip", 8230}, {"permil", 8240},
	{"prime", 8242}, {"Prime", 8243}, {"lsaquo", 8249}, {"rsaquo", 8250}, {"oline", 8254},
	{"frasl", 8260}, {"euro", 8364}, {"image", 8465}, {"weierp", 8472}, {"real", 8476},
	{"trade", 8482}, {"alefsym", 8501},
	{"larr", 8592}, {"uarr", 8593}, {"rarr", 8594}, {"darr", 8595}, {"harr", 8596},
	{"crarr", 8629}, {"lArr", 8656}, {"uArr", 8657}, {"rArr", 8658}, {"dArr", 8659},
	{"hArr", 8660},
	{"forall", 8704}, {"part", 8706}, {"exist", 8707}, {"empty", 8709}, {"nabla", 8711},
	{"isin", 8712}, {"notin", 8713}, {"ni", 8715}, {"prod", 8719}, {"sum", 8721},
	{"minus", 8722}, {"lowast", 8727}, {"radic", 8730}, {"prop", 8733}, {"infin", 8734},
	{"ang", 8736}, {"and", 8743}, {"or", 8744}, {"cap", 8745}, {"cup", 8746},
	{"int", 8747}, {"there4", 8756}, {"sim", 8764}, {"cong", 8773}, {"asymp", 8776},
	{"ne", 8800}, {"equiv", 8801}, {"le", 8804}, {"ge", 8805}, {"sub", 8834},
	{"sup", 8835}, {"nsub", 8836}, {"sube", 8838}, {"supe", 8839}, {"oplus", 8853},
	{"otimes", 8855}, {"perp", 8869}, {"sdot", 8901},
	{"lceil", 8968}, {"rceil", 8969}, {"lfloor", 8970}, {"rfloor", 8971},
	{"lang", 9001}, {"rang", 9002}, {"loz", 9674},
	{"spades", 9824}, {"clubs", 9827}, {"hearts", 9829}, {"diams", 9830},
}};

constexpr size_t MAX_ENTITY_NAME = 8;
} // namespace

char32_t html_entity_code_point(std::string_view name) noexcept {
	if (const auto it = std::ranges::find(latin1_entities, name); it != latin1_entities.end()) {
		return LATIN1_FIRST + static_cast<char32_t>(std::distance(latin1_entities.begin(), it));
	}
	const auto it = std::ranges::find(other_entities, name, &named_entity::name);
	return it == other_entities.end() ? 0 : it->code_point;
}

std::string convert_named_entities_to_numeric(std::string_view input) {
	std::string out;
	out.reserve(input.size());
	size_t pos = 0;
	while (pos < input.size()) {
		const auto amp = input.find('&', pos);
		if (amp == std::string_view::npos) {
			out.append(input.substr(pos));
			break;
		}
		out.append(input.substr(pos, amp - pos));
		size_t end = amp + 1;
		while (end < input.size() && end - amp - 1 <= MAX_ENTITY_NAME && std::isalnum(static_cast<unsigned char>(input[end])) != 0) {
			++end;
		}
		const auto name = input.substr(amp + 1, end - amp - 1);
		const char32_t cp = (end < input.size() && input[end] == ';') ? html_entity_code_point(name) : 0;
		if (cp == 0) {
			out.push_back('&');
			pos = amp + 1;
			continue;
		}
		out += "&#" + std::to_string(static_cast<unsigned long>(cp)) + ";";
		pos = end + 1;
	}
	return out;
}
} // namespace epubmeta
