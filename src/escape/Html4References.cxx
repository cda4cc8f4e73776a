// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

/*
 * The 252 named character references of HTML 4.01.
 */

#include "HtmlReferences.hxx"

static constexpr NamedReferenceData html4_references_array[] = {
	{"&quot;", 0x0022, 0},
	{"&amp;", 0x0026, 0},
	{"&lt;", 0x003c, 0},
	{"&gt;", 0x003e, 0},
	{"&nbsp;", 0x00a0, 0},
	{"&iexcl;", 0x00a1, 0},
	{"&cent;", 0x00a2, 0},
	{"&pound;", 0x00a3, 0},
	{"&curren;", 0x00a4, 0},
	{"&yen;", 0x00a5, 0},
	{"&brvbar;", 0x00a6, 0},
	{"&sect;", 0x00a7, 0},
	{"&uml;", 0x00a8, 0},
	{"&copy;", 0x00a9, 0},
	{"&ordf;", 0x00aa, 0},
	{"&laquo;", 0x00ab, 0},
	{"&not;", 0x00ac, 0},
	{"&shy;", 0x00ad, 0},
	{"&reg;", 0x00ae, 0},
	{"&macr;", 0x00af, 0},
	{"&deg;", 0x00b0, 0},
	{"&plusmn;", 0x00b1, 0},
	{"&sup2;", 0x00b2, 0},
	{"&sup3;", 0x00b3, 0},
	{"&acute;", 0x00b4, 0},
	{"&micro;", 0x00b5, 0},
	{"&para;", 0x00b6, 0},
	{"&middot;", 0x00b7, 0},
	{"&cedil;", 0x00b8, 0},
	{"&sup1;", 0x00b9, 0},
	{"&ordm;", 0x00ba, 0},
	{"&raquo;", 0x00bb, 0},
	{"&frac14;", 0x00bc, 0},
	{"&frac12;", 0x00bd, 0},
	{"&frac34;", 0x00be, 0},
	{"&iquest;", 0x00bf, 0},
	{"&Agrave;", 0x00c0, 0},
	{"&Aacute;", 0x00c1, 0},
	{"&Acirc;", 0x00c2, 0},
	{"&Atilde;", 0x00c3, 0},
	{"&Auml;", 0x00c4, 0},
	{"&Aring;", 0x00c5, 0},
	{"&AElig;", 0x00c6, 0},
	{"&Ccedil;", 0x00c7, 0},
	{"&Egrave;", 0x00c8, 0},
	{"&Eacute;", 0x00c9, 0},
	{"&Ecirc;", 0x00ca, 0},
	{"&Euml;", 0x00cb, 0},
	{"&Igrave;", 0x00cc, 0},
	{"&Iacute;", 0x00cd, 0},
	{"&Icirc;", 0x00ce, 0},
	{"&Iuml;", 0x00cf, 0},
	{"&ETH;", 0x00d0, 0},
	{"&Ntilde;", 0x00d1, 0},
	{"&Ograve;", 0x00d2, 0},
	{"&Oacute;", 0x00d3, 0},
	{"&Ocirc;", 0x00d4, 0},
	{"&Otilde;", 0x00d5, 0},
	{"&Ouml;", 0x00d6, 0},
	{"&times;", 0x00d7, 0},
	{"&Oslash;", 0x00d8, 0},
	{"&Ugrave;", 0x00d9, 0},
	{"&Uacute;", 0x00da, 0},
	{"&Ucirc;", 0x00db, 0},
	{"&Uuml;", 0x00dc, 0},
	{"&Yacute;", 0x00dd, 0},
	{"&THORN;", 0x00de, 0},
	{"&szlig;", 0x00df, 0},
	{"&agrave;", 0x00e0, 0},
	{"&aacute;", 0x00e1, 0},
	{"&acirc;", 0x00e2, 0},
	{"&atilde;", 0x00e3, 0},
	{"&auml;", 0x00e4, 0},
	{"&aring;", 0x00e5, 0},
	{"&aelig;", 0x00e6, 0},
	{"&ccedil;", 0x00e7, 0},
	{"&egrave;", 0x00e8, 0},
	{"&eacute;", 0x00e9, 0},
	{"&ecirc;", 0x00ea, 0},
	{"&euml;", 0x00eb, 0},
	{"&igrave;", 0x00ec, 0},
	{"&iacute;", 0x00ed, 0},
	{"&icirc;", 0x00ee, 0},
	{"&iuml;", 0x00ef, 0},
	{"&eth;", 0x00f0, 0},
	{"&ntilde;", 0x00f1, 0},
	{"&ograve;", 0x00f2, 0},
	{"&oacute;", 0x00f3, 0},
	{"&ocirc;", 0x00f4, 0},
	{"&otilde;", 0x00f5, 0},
	{"&ouml;", 0x00f6, 0},
	{"&divide;", 0x00f7, 0},
	{"&oslash;", 0x00f8, 0},
	{"&ugrave;", 0x00f9, 0},
	{"&uacute;", 0x00fa, 0},
	{"&ucirc;", 0x00fb, 0},
	{"&uuml;", 0x00fc, 0},
	{"&yacute;", 0x00fd, 0},
	{"&thorn;", 0x00fe, 0},
	{"&yuml;", 0x00ff, 0},
	{"&OElig;", 0x0152, 0},
	{"&oelig;", 0x0153, 0},
	{"&Scaron;", 0x0160, 0},
	{"&scaron;", 0x0161, 0},
	{"&Yuml;", 0x0178, 0},
	{"&fnof;", 0x0192, 0},
	{"&circ;", 0x02c6, 0},
	{"&tilde;", 0x02dc, 0},
	{"&Alpha;", 0x0391, 0},
	{"&Beta;", 0x0392, 0},
	{"&Gamma;", 0x0393, 0},
	{"&Delta;", 0x0394, 0},
	{"&Epsilon;", 0x0395, 0},
	{"&Zeta;", 0x0396, 0},
	{"&Eta;", 0x0397, 0},
	{"&Theta;", 0x0398, 0},
	{"&Iota;", 0x0399, 0},
	{"&Kappa;", 0x039a, 0},
	{"&Lambda;", 0x039b, 0},
	{"&Mu;", 0x039c, 0},
	{"&Nu;", 0x039d, 0},
	{"&Xi;", 0x039e, 0},
	{"&Omicron;", 0x039f, 0},
	{"&Pi;", 0x03a0, 0},
	{"&Rho;", 0x03a1, 0},
	{"&Sigma;", 0x03a3, 0},
	{"&Tau;", 0x03a4, 0},
	{"&Upsilon;", 0x03a5, 0},
	{"&Phi;", 0x03a6, 0},
	{"&Chi;", 0x03a7, 0},
	{"&Psi;", 0x03a8, 0},
	{"&Omega;", 0x03a9, 0},
	{"&alpha;", 0x03b1, 0},
	{"&beta;", 0x03b2, 0},
	{"&gamma;", 0x03b3, 0},
	{"&delta;", 0x03b4, 0},
	{"&epsilon;", 0x03b5, 0},
	{"&zeta;", 0x03b6, 0},
	{"&eta;", 0x03b7, 0},
	{"&theta;", 0x03b8, 0},
	{"&iota;", 0x03b9, 0},
	{"&kappa;", 0x03ba, 0},
	{"&lambda;", 0x03bb, 0},
	{"&mu;", 0x03bc, 0},
	{"&nu;", 0x03bd, 0},
	{"&xi;", 0x03be, 0},
	{"&omicron;", 0x03bf, 0},
	{"&pi;", 0x03c0, 0},
	{"&rho;", 0x03c1, 0},
	{"&sigmaf;", 0x03c2, 0},
	{"&sigma;", 0x03c3, 0},
	{"&tau;", 0x03c4, 0},
	{"&upsilon;", 0x03c5, 0},
	{"&phi;", 0x03c6, 0},
	{"&chi;", 0x03c7, 0},
	{"&psi;", 0x03c8, 0},
	{"&omega;", 0x03c9, 0},
	{"&thetasym;", 0x03d1, 0},
	{"&upsih;", 0x03d2, 0},
	{"&piv;", 0x03d6, 0},
	{"&ensp;", 0x2002, 0},
	{"&emsp;", 0x2003, 0},
	{"&thinsp;", 0x2009, 0},
	{"&zwnj;", 0x200c, 0},
	{"&zwj;", 0x200d, 0},
	{"&lrm;", 0x200e, 0},
	{"&rlm;", 0x200f, 0},
	{"&ndash;", 0x2013, 0},
	{"&mdash;", 0x2014, 0},
	{"&lsquo;", 0x2018, 0},
	{"&rsquo;", 0x2019, 0},
	{"&sbquo;", 0x201a, 0},
	{"&ldquo;", 0x201c, 0},
	{"&rdquo;", 0x201d, 0},
	{"&bdquo;", 0x201e, 0},
	{"&dagger;", 0x2020, 0},
	{"&Dagger;", 0x2021, 0},
	{"&bull;", 0x2022, 0},
	{"&hellip;", 0x2026, 0},
	{"&permil;", 0x2030, 0},
	{"&prime;", 0x2032, 0},
	{"&Prime;", 0x2033, 0},
	{"&lsaquo;", 0x2039, 0},
	{"&rsaquo;", 0x203a, 0},
	{"&oline;", 0x203e, 0},
	{"&frasl;", 0x2044, 0},
	{"&euro;", 0x20ac, 0},
	{"&image;", 0x2111, 0},
	{"&weierp;", 0x2118, 0},
	{"&real;", 0x211c, 0},
	{"&trade;", 0x2122, 0},
	{"&alefsym;", 0x2135, 0},
	{"&larr;", 0x2190, 0},
	{"&uarr;", 0x2191, 0},
	{"&rarr;", 0x2192, 0},
	{"&darr;", 0x2193, 0},
	{"&harr;", 0x2194, 0},
	{"&crarr;", 0x21b5, 0},
	{"&lArr;", 0x21d0, 0},
	{"&uArr;", 0x21d1, 0},
	{"&rArr;", 0x21d2, 0},
	{"&dArr;", 0x21d3, 0},
	{"&hArr;", 0x21d4, 0},
	{"&forall;", 0x2200, 0},
	{"&part;", 0x2202, 0},
	{"&exist;", 0x2203, 0},
	{"&empty;", 0x2205, 0},
	{"&nabla;", 0x2207, 0},
	{"&isin;", 0x2208, 0},
	{"&notin;", 0x2209, 0},
	{"&ni;", 0x220b, 0},
	{"&prod;", 0x220f, 0},
	{"&sum;", 0x2211, 0},
	{"&minus;", 0x2212, 0},
	{"&lowast;", 0x2217, 0},
	{"&radic;", 0x221a, 0},
	{"&prop;", 0x221d, 0},
	{"&infin;", 0x221e, 0},
	{"&ang;", 0x2220, 0},
	{"&and;", 0x2227, 0},
	{"&or;", 0x2228, 0},
	{"&cap;", 0x2229, 0},
	{"&cup;", 0x222a, 0},
	{"&int;", 0x222b, 0},
	{"&there4;", 0x2234, 0},
	{"&sim;", 0x223c, 0},
	{"&cong;", 0x2245, 0},
	{"&asymp;", 0x2248, 0},
	{"&ne;", 0x2260, 0},
	{"&equiv;", 0x2261, 0},
	{"&le;", 0x2264, 0},
	{"&ge;", 0x2265, 0},
	{"&sub;", 0x2282, 0},
	{"&sup;", 0x2283, 0},
	{"&nsub;", 0x2284, 0},
	{"&sube;", 0x2286, 0},
	{"&supe;", 0x2287, 0},
	{"&oplus;", 0x2295, 0},
	{"&otimes;", 0x2297, 0},
	{"&perp;", 0x22a5, 0},
	{"&sdot;", 0x22c5, 0},
	{"&lceil;", 0x2308, 0},
	{"&rceil;", 0x2309, 0},
	{"&lfloor;", 0x230a, 0},
	{"&rfloor;", 0x230b, 0},
	{"&lang;", 0x2329, 0},
	{"&rang;", 0x232a, 0},
	{"&loz;", 0x25ca, 0},
	{"&spades;", 0x2660, 0},
	{"&clubs;", 0x2663, 0},
	{"&hearts;", 0x2665, 0},
	{"&diams;", 0x2666, 0},
};

std::span<const NamedReferenceData>
GetHtml4References() noexcept
{
	return html4_references_array;
}
