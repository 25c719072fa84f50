#include "char_maps.hpp"

#include <array>

static constexpr auto PETCAT_TOKENS = std::array {
    CharToken{ "{wht}",  5 },
    CharToken{ "{dish}", 8 },   // disable shift + C= case switch
    CharToken{ "{ensh}", 9 },
    CharToken{ "{swlc}", 14 },  // switch to lower case
    CharToken{ "{down}", 17 },
    CharToken{ "{rvon}", 18 },
    CharToken{ "{home}", 19 },
    CharToken{ "{del}",  20 },
    CharToken{ "{red}",  28 },
    CharToken{ "{rght}", 29 },
    CharToken{ "{grn}",  30 },
    CharToken{ "{blu}",  31 },
    CharToken{ "{orng}", 129 },
    CharToken{ "{f1}",   133 },
    CharToken{ "{f3}",   134 },
    CharToken{ "{f5}",   135 },
    CharToken{ "{f7}",   136 },
    CharToken{ "{f2}",   137 },
    CharToken{ "{f4}",   138 },
    CharToken{ "{f6}",   139 },
    CharToken{ "{f8}",   140 },
    CharToken{ "{sret}", 141 },
    CharToken{ "{swuc}", 142 }, // switch to upper case
    CharToken{ "{blk}",  144 },
    CharToken{ "{up}",   145 },
    CharToken{ "{rvof}", 146 },
    CharToken{ "{clr}",  147 },
    CharToken{ "{inst}", 148 },
    CharToken{ "{brn}",  149 },
    CharToken{ "{lred}", 150 },
    CharToken{ "{gry1}", 151 },
    CharToken{ "{gry2}", 152 },
    CharToken{ "{lgrn}", 153 },
    CharToken{ "{lblu}", 154 },
    CharToken{ "{gry3}", 155 },
    CharToken{ "{pur}",  156 },
    CharToken{ "{left}", 157 },
    CharToken{ "{yel}",  158 },
    CharToken{ "{cyn}",  159 },
    CharToken{ "{sspc}", 160 },
};

// Ahoy printed these as underlined (Shift) or overlined (Commodore key)
// characters up to Oct 1984; typists enter them as {s x} / {c x}.
static constexpr auto SHIFT_CMDRE_TOKENS = std::array {
    CharToken{ "{s a}", 193 }, CharToken{ "{s b}", 194 }, CharToken{ "{s c}", 195 },
    CharToken{ "{s d}", 196 }, CharToken{ "{s e}", 197 }, CharToken{ "{s f}", 198 },
    CharToken{ "{s g}", 199 }, CharToken{ "{s h}", 200 }, CharToken{ "{s i}", 201 },
    CharToken{ "{s j}", 202 }, CharToken{ "{s k}", 203 }, CharToken{ "{s l}", 204 },
    CharToken{ "{s m}", 205 }, CharToken{ "{s n}", 206 }, CharToken{ "{s o}", 207 },
    CharToken{ "{s p}", 208 }, CharToken{ "{s q}", 209 }, CharToken{ "{s r}", 210 },
    CharToken{ "{s s}", 211 }, CharToken{ "{s t}", 212 }, CharToken{ "{s u}", 213 },
    CharToken{ "{s v}", 214 }, CharToken{ "{s w}", 215 }, CharToken{ "{s x}", 216 },
    CharToken{ "{s y}", 217 }, CharToken{ "{s z}", 218 },

    CharToken{ "{c a}", 176 }, CharToken{ "{c b}", 191 }, CharToken{ "{c c}", 188 },
    CharToken{ "{c d}", 172 }, CharToken{ "{c e}", 177 }, CharToken{ "{c f}", 187 },
    CharToken{ "{c g}", 165 }, CharToken{ "{c h}", 180 }, CharToken{ "{c i}", 162 },
    CharToken{ "{c j}", 181 }, CharToken{ "{c k}", 161 }, CharToken{ "{c l}", 182 },
    CharToken{ "{c m}", 167 }, CharToken{ "{c n}", 170 }, CharToken{ "{c o}", 185 },
    CharToken{ "{c p}", 175 }, CharToken{ "{c q}", 171 }, CharToken{ "{c r}", 178 },
    CharToken{ "{c s}", 174 }, CharToken{ "{c t}", 163 }, CharToken{ "{c u}", 184 },
    CharToken{ "{c v}", 190 }, CharToken{ "{c w}", 179 }, CharToken{ "{c x}", 189 },
    CharToken{ "{c y}", 183 }, CharToken{ "{c z}", 173 },

    CharToken{ "{s *}", 192 }, CharToken{ "{c *}", 223 },
    CharToken{ "{s +}", 219 }, CharToken{ "{c +}", 166 },
    CharToken{ "{s -}", 221 }, CharToken{ "{c -}", 220 },
    CharToken{ "{s @}", 186 }, CharToken{ "{c @}", 164 },
    CharToken{ "{s ep}", 169 }, CharToken{ "{c ep}", 168 },
    CharToken{ "{s up_arrow}", 222 },
    CharToken{ "{s return}", 141 },
    CharToken{ "{s space}", 160 },

    // Keys with no modern counterpart
    CharToken{ "{ep}", 92 },          // British pound
    CharToken{ "{up_arrow}", 94 },
    CharToken{ "{left_arrow}", 95 },
    CharToken{ "{pi}", 255 },
};

static constexpr auto TOKENS_V2 = std::array {
    CharToken{ "end",     128 },
    CharToken{ "for",     129 },
    CharToken{ "next",    130 },
    CharToken{ "data",    131 },
    CharToken{ "input#",  132 },
    CharToken{ "input",   133 },
    CharToken{ "dim",     134 },
    CharToken{ "read",    135 },
    CharToken{ "let",     136 },
    CharToken{ "goto",    137 },
    CharToken{ "run",     138 },
    CharToken{ "if",      139 },
    CharToken{ "restore", 140 },
    CharToken{ "gosub",   141 },
    CharToken{ "return",  142 },
    CharToken{ "rem",     143 },
    CharToken{ "stop",    144 },
    CharToken{ "on",      145 },
    CharToken{ "wait",    146 },
    CharToken{ "load",    147 },
    CharToken{ "save",    148 },
    CharToken{ "verify",  149 },
    CharToken{ "def",     150 },
    CharToken{ "poke",    151 },
    CharToken{ "print#",  152 },
    CharToken{ "print",   153 },
    CharToken{ "cont",    154 },
    CharToken{ "list",    155 },
    CharToken{ "clr",     156 },
    CharToken{ "cmd",     157 },
    CharToken{ "sys",     158 },
    CharToken{ "open",    159 },
    CharToken{ "close",   160 },
    CharToken{ "get",     161 },
    CharToken{ "new",     162 },
    CharToken{ "tab(",    163 },
    CharToken{ "to",      164 },
    CharToken{ "fn",      165 },
    CharToken{ "spc(",    166 },
    CharToken{ "then",    167 },
    CharToken{ "not",     168 },
    CharToken{ "step",    169 },
    CharToken{ "+",       170 },
    CharToken{ "-",       171 },
    CharToken{ "*",       172 },
    CharToken{ "/",       173 },
    CharToken{ "^",       174 },
    CharToken{ "and",     175 },
    CharToken{ "or",      176 },
    CharToken{ ">",       177 },
    CharToken{ "=",       178 },
    CharToken{ "<",       179 },
    CharToken{ "sgn",     180 },
    CharToken{ "int",     181 },
    CharToken{ "abs",     182 },
    CharToken{ "usr",     183 },
    CharToken{ "fre",     184 },
    CharToken{ "pos",     185 },
    CharToken{ "sqr",     186 },
    CharToken{ "rnd",     187 },
    CharToken{ "log",     188 },
    CharToken{ "exp",     189 },
    CharToken{ "cos",     190 },
    CharToken{ "sin",     191 },
    CharToken{ "tan",     192 },
    CharToken{ "atn",     193 },
    CharToken{ "peek",    194 },
    CharToken{ "len",     195 },
    CharToken{ "str$",    196 },
    CharToken{ "val",     197 },
    CharToken{ "asc",     198 },
    CharToken{ "chr$",    199 },
    CharToken{ "left$",   200 },
    CharToken{ "right$",  201 },
    CharToken{ "mid$",    202 },
    CharToken{ "go",      203 }, // after goto/gosub!
};

std::span<const CharToken> petcat_tokens() { return PETCAT_TOKENS; }

std::span<const CharToken> shift_commodore_tokens() { return SHIFT_CMDRE_TOKENS; }

std::span<const CharToken> basic_v2_tokens() { return TOKENS_V2; }

const CodeMap &ahoy_to_petcat() {
    static auto table = CodeMap {
        // Two-letter codes, 1984 onwards
        { "{SC}", "{clr}"  },
        { "{HM}", "{home}" },
        { "{CU}", "{up}"   },
        { "{CD}", "{down}" },
        { "{CL}", "{left}" },
        { "{CR}", "{rght}" },
        { "{SS}", "{sspc}" },
        { "{IN}", "{inst}" },
        { "{RV}", "{rvon}" },
        { "{RO}", "{rvof}" },

        { "{BK}", "{blk}"  },
        { "{WH}", "{wht}"  },
        { "{RD}", "{red}"  },
        { "{CY}", "{cyn}"  },
        { "{PU}", "{pur}"  },
        { "{GN}", "{grn}"  },
        { "{BL}", "{blu}"  },
        { "{YL}", "{yel}"  },
        { "{OR}", "{orng}" },
        { "{BR}", "{brn}"  },
        { "{LR}", "{lred}" },
        { "{G1}", "{gry1}" },
        { "{G2}", "{gry2}" },
        { "{LG}", "{lgrn}" },
        { "{LB}", "{lblu}" },
        { "{G3}", "{gry3}" },

        { "{F1}", "{f1}" },
        { "{F2}", "{f2}" },
        { "{F3}", "{f3}" },
        { "{F4}", "{f4}" },
        { "{F5}", "{f5}" },
        { "{F6}", "{f6}" },
        { "{F7}", "{f7}" },
        { "{F8}", "{f8}" },

        // Spelled-out names used by the later (bracketed) listings
        { "{CLEAR}",   "{clr}"  },
        { "{HOME}",    "{home}" },
        { "{UP}",      "{up}"   },
        { "{DOWN}",    "{down}" },
        { "{LEFT}",    "{left}" },
        { "{RIGHT}",   "{rght}" },
        { "{INSERT}",  "{inst}" },
        { "{DEL}",     "{del}"  },
        { "{RVSON}",   "{rvon}" },
        { "{RVSOFF}",  "{rvof}" },

        { "{BLACK}",   "{blk}"  },
        { "{WHITE}",   "{wht}"  },
        { "{RED}",     "{red}"  },
        { "{CYAN}",    "{cyn}"  },
        { "{PURPLE}",  "{pur}"  },
        { "{GREEN}",   "{grn}"  },
        { "{BLUE}",    "{blu}"  },
        { "{YELLOW}",  "{yel}"  },
        { "{ORANGE}",  "{orng}" },
        { "{BROWN}",   "{brn}"  },
        { "{LTRED}",   "{lred}" },
        { "{GRAY1}",   "{gry1}" },
        { "{GRAY2}",   "{gry2}" },
        { "{LTGREEN}", "{lgrn}" },
        { "{LTBLUE}",  "{lblu}" },
        { "{GRAY3}",   "{gry3}" },
    };
    return table;
}
