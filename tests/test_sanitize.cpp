#include "wfsdl/sanitize.hpp"

#include "test_support.hpp"

#include <iostream>
#include <string>
#include <vector>

int main() {
    using namespace wfsdl;

    assert(sanitize_name("Gmina Test") == "Gmina Test");
    assert(sanitize_name("  Gmina Test \t") == "Gmina Test");
    assert(sanitize_name("a\\b/c*d?e:f\"g<h>i|j") == "abcdefghij");
    assert(sanitize_name("") == "");
    assert(sanitize_name("  ") == "");
    assert(sanitize_name("???") == "");
    // internal whitespace and case are preserved
    assert(sanitize_name("Starosta  Powiatu  Łódzkiego") == "Starosta  Powiatu  Łódzkiego");
    // stripping may expose whitespace that is then trimmed
    assert(sanitize_name(" | Miasto | ") == "Miasto");
    assert(sanitize_name("\"Gmina\" Nowa") == "Gmina Nowa");

    const std::string forbidden = "\\/*?:\"<>|";
    const std::vector<std::string> samples = {
        "Prezydent Miasta Krakowa", "C:\\temp\\x", "a/b/c", " ?x? ", "<<>>", "ok|ok",
        "\t\"quoted\"\n", "ms:budynki", "Wójt Gminy: Zębowice", "",
    };
    for (const auto& s : samples) {
        const std::string once = sanitize_name(s);
        assert(once.find_first_of(forbidden) == std::string::npos);
        assert(sanitize_name(once) == once);
    }

    // UTF-8 no-break spaces around a name are trimmed too
    assert(sanitize_name("\xC2\xA0Gmina Test\xC2\xA0 ") == "Gmina Test");
    assert(sanitize_name("Gmina\xC2\xA0Test") == "Gmina\xC2\xA0Test");
    assert(sanitize_name("\xC2\xA0") == "");

    assert(is_usable_dir_name("Gmina Test"));
    assert(is_usable_dir_name("..."));
    assert(!is_usable_dir_name(sanitize_name("???")));
    assert(!is_usable_dir_name(sanitize_name(" * ")));
    assert(!is_usable_dir_name("."));
    assert(!is_usable_dir_name(".."));

    assert(layer_file_name("ms:budynki") == "ms_budynki.gml");
    assert(layer_file_name("ms:dzialki") == "ms_dzialki.gml");
    assert(layer_file_name("budynki") == "budynki.gml");
    assert(layer_file_name("a/b:c") == "ab_c.gml");

    std::cout << "test_sanitize: OK\n";
    return 0;
}
