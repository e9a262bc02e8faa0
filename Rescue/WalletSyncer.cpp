#include"Ev/Io.hpp"
#include"Node/NodeIF.hpp"
#include"Rescue/WalletSyncer.hpp"
#include"Rescue/log.hpp"

namespace Rescue {

Ev::Io<void> WalletSyncer::sync() {
	return Rescue::log(logger, Info, "syncing wallets").then([this]() {
		return node.sync_wallets();
	}).then([this]() {
		return Rescue::log(logger, Info, "wallets synced");
	});
}

}
