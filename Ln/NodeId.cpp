#include"Ln/NodeId.hpp"
#include"Secp256k1/Detail/context.hpp"
#include"Util/Str.hpp"
#include<algorithm>
#include<secp256k1.h>
#include<string.h>

using Secp256k1::Detail::context;

namespace {

bool on_curve(std::uint8_t const raw[33]) {
	auto pk = secp256k1_pubkey();
	return secp256k1_ec_pubkey_parse(context(), &pk, raw, 33) == 1;
}

}

namespace Ln {

NodeId::NodeId(std::string const& s) {
	if (!valid_string(s))
		throw InvalidNodeId(s);

	auto val = Util::Str::hexread(s);

	/* Create a temporary writeable Impl and copy the data over.  */
	auto tmp = std::make_shared<Impl>();
	std::copy(val.begin(), val.end(), tmp->raw);
	/* Now promote it to our Impl const*.  */
	pimpl = std::move(tmp);
}

bool NodeId::valid_string(std::string const& s) {
	if (s.size() != 66)
		return false;
	if (!Util::Str::ishex(s))
		return false;
	if (s[0] != '0')
		return false;
	if (s[1] != '2' && s[1] != '3')
		return false;
	auto val = Util::Str::hexread(s);
	return on_curve(&val[0]);
}

NodeId::operator std::string() const {
	return Util::Str::hexdump(pimpl->raw, sizeof(pimpl->raw));
}

bool NodeId::operator==(NodeId const& o) const {
	if (o.pimpl == pimpl)
		return true;
	/* Non-constant-time compare!
	 * This should be fine since node IDs are public keys and
	 * not secrets.
	 */
	return 0 == memcmp(pimpl->raw, o.pimpl->raw, sizeof(pimpl->raw));
}
bool NodeId::operator<(NodeId const& o) const {
	if (o.pimpl == pimpl)
		return false;
	return memcmp(pimpl->raw, o.pimpl->raw, sizeof(pimpl->raw)) < 0;
}

std::ostream& operator<<(std::ostream& os, NodeId const& n) {
	return os << (std::string) n;
}

}
