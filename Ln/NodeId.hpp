#ifndef LN_NODEID_HPP
#define LN_NODEID_HPP

#include"Util/BacktraceException.hpp"
#include<cstdint>
#include<iostream>
#include<memory>
#include<stdexcept>
#include<string>

namespace Ln {

struct InvalidNodeId : public Util::BacktraceException<std::invalid_argument> {
	explicit
	InvalidNodeId(std::string const& s)
		: Util::BacktraceException<std::invalid_argument>(
			"invalid node ID: " + s
		  ) { }
};

/** class Ln::NodeId
 *
 * @brief object to represent the public key of a
 * node, i.e. the node ID.
 *
 * @desc Always holds a compressed secp256k1 point
 * that is actually on the curve.
 */
class NodeId {
private:
	struct Impl {
		std::uint8_t raw[33];
	};
	std::shared_ptr<Impl const> pimpl;

public:
	NodeId() =delete;
	NodeId(NodeId&&) =default;
	NodeId(NodeId const&) =default;
	/* Throws Ln::InvalidNodeId.  */
	explicit
	NodeId(std::string const&);
	~NodeId() =default;

	static bool valid_string(std::string const&);

	NodeId& operator=(NodeId const&) =default;
	NodeId& operator=(NodeId&&) =default;

	explicit
	operator std::string() const;

	bool operator==(NodeId const& o) const;
	bool operator!=(NodeId const& o) const {
		return !(*this == o);
	}
	bool operator<(NodeId const& o) const;
};

std::ostream& operator<<(std::ostream&, NodeId const&);

}

#endif /* LN_NODEID_HPP */
