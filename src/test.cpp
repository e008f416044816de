#include "blackcheck/kernel/engine.h"
#include "blackcheck/policy/transactions.h"

using namespace blackcheck;

class tests
{
public:
	struct account
	{
		ledger::wallet wallet;
		uint64_t nonce = 0;

		account() = default;
		account(const ledger::wallet& new_wallet) : wallet(new_wallet)
		{
		}
		const algorithm::pubkeyhash_t& address() const
		{
			return wallet.public_key_hash;
		}
	};

	struct environment
	{
		ledger::memory_registry registry;
		ledger::engine engine;

		environment() : engine(&registry)
		{
			registry.bind_receiver(engine.address(), &engine);
		}
		algorithm::item_id mint(const account& owner, uint8_t rank)
		{
			return registry.mint(owner.address(), rank).expect("item mint failed");
		}
		algorithm::pubkeyhash_t owner_of(const algorithm::item_id& id)
		{
			return registry.owner_of(id).expect("item does not exist");
		}
		template <typename t>
		expects_lr<ledger::receipt> submit(account& user, t& request)
		{
			VI_PANIC(request.sign(user.wallet.secret_key, user.nonce), "authentication failed");
			auto result = engine.submit(request);
			if (result)
				++user.nonce;
			return result;
		}
		expects_lr<ledger::receipt> deposit(account& user, const vector<algorithm::item_id>& ids)
		{
			transactions::deposit request;
			request.ids = ids;
			return submit(user, request);
		}
		expects_lr<ledger::receipt> redeem(account& user, const algorithm::item_id& id)
		{
			transactions::redeem request;
			request.id = id;
			return submit(user, request);
		}
		expects_lr<ledger::receipt> composite(account& user, const algorithm::item_id& keep_id, const algorithm::item_id& burn_id)
		{
			transactions::composite request;
			request.keep_id = keep_id;
			request.burn_id = burn_id;
			return submit(user, request);
		}
		expects_lr<ledger::receipt> aggregate(account& user, const vector<algorithm::item_id>& ids)
		{
			transactions::aggregate request;
			request.ids = ids;
			return submit(user, request);
		}
		expects_lr<ledger::receipt> transfer(account& user, const algorithm::pubkeyhash_t& to, const uint256_t& value)
		{
			transactions::transfer request;
			request.to = to;
			request.value = value;
			return submit(user, request);
		}
		void verify()
		{
			auto status = engine.verify_invariants();
			VI_PANIC(status, "ledger invariants violated");
		}
	};

	class generators
	{
	public:
		static account new_account(const std::string_view& seed)
		{
			return account(ledger::wallet::from_seed(seed));
		}
		template <typename t>
		static bool fails_with(expects_lr<t>& result, error_code code)
		{
			if (result)
				return false;

			auto* term = console::get();
			term->fwrite_line("expected failure: [%s] %s", layer_exception::code_name(result.error().code()).data(), result.error().what());
			return result.error().is(code);
		}
	};

public:
	/* rank to amount mapping */
	static void rank_amounts()
	{
		auto* term = console::get();
		uint256_t unit = algorithm::rank::unit();
		VI_PANIC(unit == uint256_t(1000000000000000000ull), "unit must have 18 decimals");
		VI_PANIC(algorithm::rank::max_supply() == unit, "max supply must equal one unit");
		for (uint8_t i = 0; i < algorithm::rank::max_rank(); i++)
		{
			uint256_t expected = uint256_t(1ull << i) * unit / uint256_t(4096);
			VI_PANIC(algorithm::rank::amount_for(i) == expected, "rank amount mismatch");
			term->fwrite_line("rank %i: %s", (int)i, algorithm::rank::to_decimal(algorithm::rank::amount_for(i)).to_string().c_str());
		}

		uint256_t single_tier = algorithm::rank::amount_for(algorithm::rank::aggregate_rank());
		VI_PANIC(algorithm::rank::amount_for(0) == unit / uint256_t(4096), "rank 0 amount mismatch");
		VI_PANIC(single_tier == uint256_t(64) * unit / uint256_t(4096), "single tier amount mismatch");
		VI_PANIC(single_tier * uint256_t(algorithm::rank::aggregate_size()) == algorithm::rank::max_supply(), "aggregate inputs must cover the whole supply");
		VI_PANIC(algorithm::rank::amount_for(algorithm::rank::max_rank()) == algorithm::rank::max_supply(), "maximal rank must be worth the whole supply");
		VI_PANIC(algorithm::rank::amount_for(algorithm::rank::max_rank()) > algorithm::rank::amount_for(algorithm::rank::aggregate_rank()) * uint256_t(2), "maximal rank must break the doubling");
		VI_PANIC(algorithm::rank::is_valid(7) && !algorithm::rank::is_valid(8), "rank bounds mismatch");
	}
	/* secp256k1 signatures and address encoding */
	static void cryptography_signatures()
	{
		auto* term = console::get();
		auto wallet = ledger::wallet::from_seed("cryptography");
		string message = "Hello, world!";
		uint256_t message_hash = algorithm::hashing::hash256i(message);
		algorithm::hashsig_t message_signature;
		algorithm::pubkey_t recover_public_key;
		algorithm::pubkeyhash_t recover_public_key_hash;
		bool verifies = algorithm::signing::sign(message_hash, wallet.secret_key, message_signature) && algorithm::signing::verify(message_hash, wallet.public_key, message_signature);
		bool recovers_public_key = algorithm::signing::recover(message_hash, recover_public_key, message_signature);
		bool recovers_public_key_hash = algorithm::signing::recover_hash(message_hash, recover_public_key_hash, message_signature);

		string address = wallet.get_address();
		algorithm::pubkeyhash_t decoded_address;
		bool decodes = algorithm::signing::decode_address(address, decoded_address);
		term->jwrite_line(*wallet.as_schema());

		VI_PANIC(algorithm::signing::verify_secret_key(wallet.secret_key), "bad secret key");
		VI_PANIC(algorithm::signing::verify_public_key(wallet.public_key), "bad public key");
		VI_PANIC(algorithm::signing::verify_address(address), "bad address");
		VI_PANIC(!algorithm::signing::verify_address("0x" + address), "malformed address accepted");
		VI_PANIC(decodes && decoded_address == wallet.public_key_hash, "address does not decode to its owner");
		VI_PANIC(verifies, "bad signature");
		VI_PANIC(recovers_public_key && recover_public_key == wallet.public_key, "failed to recover public key from signature");
		VI_PANIC(recovers_public_key_hash && recover_public_key_hash == wallet.public_key_hash, "failed to recover address from signature");
		VI_PANIC(ledger::wallet::from_seed("cryptography").public_key_hash == wallet.public_key_hash, "seeded wallet is not deterministic");
		VI_PANIC(ledger::wallet::from_seed("other").public_key_hash != wallet.public_key_hash, "distinct seeds share a wallet");

		transactions::redeem request;
		request.id = 1;
		auto watch = ledger::wallet::from_public_key_hash(wallet.public_key_hash);
		VI_PANIC(wallet.verify_secret_key() && wallet.verify_public_key(), "wallet keys mismatch");
		VI_PANIC(wallet.sign(request) && wallet.verify(request) && wallet.recovers(request), "wallet message authentication failed");
		VI_PANIC(!watch.has_secret_key() && watch.recovers(request) && watch.get_address() == address, "watch wallet mismatch");
	}
	/* request encoding and decoding through the resolver */
	static void generic_message_serialization()
	{
		auto* term = console::get();
		auto user = generators::new_account("serialization");
		auto other = generators::new_account("serialization:other");
		auto verify_message = [&](ledger::transaction& request)
		{
			VI_PANIC(request.sign(user.wallet.secret_key, 7), "authentication failed");
			auto message = request.as_message();
			auto copy = transactions::resolver::decode(message.data).expect("request decoding failed");
			algorithm::pubkeyhash_t signer;
			VI_PANIC(copy->as_type() == request.as_type(), "request type mismatch");
			VI_PANIC(copy->as_hash() == request.as_hash(), "request hash mismatch");
			VI_PANIC(copy->nonce == 7, "request nonce mismatch");
			VI_PANIC(copy->recover_hash(signer) && signer == user.address(), "request signer mismatch");
			term->jwrite_line(*copy->as_schema());
		};

		auto large = algorithm::hashing::hash256i("large item");
		VI_PANIC(algorithm::encoding::decode_0xhex256(algorithm::encoding::encode_0xhex256(large)) == large, "uint256 hex encoding mismatch");

		transactions::deposit deposit;
		deposit.ids = { 1, 2, large };
		verify_message(deposit);

		transactions::redeem redeem;
		redeem.id = 42;
		verify_message(redeem);

		transactions::composite composite;
		composite.keep_id = 3;
		composite.burn_id = 9;
		verify_message(composite);

		transactions::aggregate aggregate;
		for (uint64_t i = 0; i < algorithm::rank::aggregate_size(); i++)
			aggregate.ids.push_back(i + 100);
		verify_message(aggregate);

		transactions::transfer transfer;
		transfer.to = other.address();
		transfer.value = algorithm::rank::amount_for(3);
		verify_message(transfer);

		ledger::receipt receipt;
		receipt.transaction_hash = transfer.as_hash();
		receipt.sequence = 11;
		receipt.successful = true;
		receipt.from = user.address();
		receipt.emit_event<states::token_supply>({ format::variable(algorithm::rank::unit()) });
		receipt.emit_event<transactions::redeem>({ format::variable(other.address().view()), format::variable((uint64_t)42), format::variable(true) });

		auto message = receipt.as_message();
		auto reader = message.ro();
		ledger::receipt receipt_copy;
		VI_PANIC(receipt_copy.load(reader), "receipt decoding failed");
		VI_PANIC(receipt_copy.as_hash() == receipt.as_hash(), "receipt hash mismatch");
		VI_PANIC(receipt_copy.events.size() == 2 && receipt_copy.find_event<transactions::redeem>() != nullptr, "receipt events mismatch");
		term->jwrite_line(*receipt_copy.as_schema());

		auto truncated = transactions::resolver::decode(std::string_view(transfer.as_message().data).substr(0, 8));
		VI_PANIC(generators::fails_with(truncated, error_code::invalid_request), "truncated request accepted");

		auto unknown = transactions::resolver::decode("garbage");
		VI_PANIC(generators::fails_with(unknown, error_code::invalid_request), "unknown request accepted");
	}
	/* deposit credits the prior owner */
	static void conversion_deposit()
	{
		auto* term = console::get();
		environment env;
		auto alice = generators::new_account("alice");
		auto id = env.mint(alice, 0);
		auto amount = algorithm::rank::amount_for(0);

		auto receipt = env.deposit(alice, { id }).expect("deposit failed");
		VI_PANIC(env.engine.balance_of(alice.address()) == amount, "depositor balance mismatch");
		VI_PANIC(env.engine.total_issued() == amount, "issued supply mismatch");
		VI_PANIC(env.owner_of(id) == env.engine.address(), "engine does not hold the item");
		VI_PANIC(env.engine.nonce_of(alice.address()) == 1, "nonce was not incremented");

		auto* event = receipt.find_event<transactions::deposit>();
		VI_PANIC(event != nullptr && event->size() == 4, "deposit event missing");
		VI_PANIC((*event)[0].as_string() == alice.address().view(), "deposit event owner mismatch");
		VI_PANIC((*event)[1].as_uint256() == id && (*event)[2].as_uint8() == 0, "deposit event item mismatch");
		VI_PANIC((*event)[3].as_uint256() == amount, "deposit event amount mismatch");

		auto* supply = receipt.reverse_find_event<states::token_supply>();
		VI_PANIC(supply != nullptr && (*supply)[0].as_uint256() == amount, "supply event mismatch");
		term->jwrite_line(*receipt.as_schema());
		term->jwrite_line(*env.engine.as_schema());
		env.verify();
	}
	/* deposit then redeem restores the prior state */
	static void conversion_round_trip()
	{
		environment env;
		auto alice = generators::new_account("alice");
		auto id = env.mint(alice, 4);

		env.deposit(alice, { id }).expect("deposit failed");
		VI_PANIC(env.engine.balance_of(alice.address()) == algorithm::rank::amount_for(4), "depositor balance mismatch");

		auto receipt = env.redeem(alice, id).expect("redemption failed");
		VI_PANIC(env.engine.balance_of(alice.address()) == 0, "redeemer balance must be empty");
		VI_PANIC(env.engine.total_issued() == 0, "issued supply must be empty");
		VI_PANIC(env.owner_of(id) == alice.address(), "item was not returned");

		auto* event = receipt.find_event<transactions::redeem>();
		VI_PANIC(event != nullptr && (*event)[3].as_uint256() == algorithm::rank::amount_for(4), "redeem event mismatch");

		auto again = env.redeem(alice, id);
		VI_PANIC(generators::fails_with(again, error_code::not_in_custody), "released item redeemed twice");
		env.verify();
	}
	/* caller deposits on behalf of an owner */
	static void conversion_deposit_on_behalf()
	{
		environment env;
		auto alice = generators::new_account("alice");
		auto bob = generators::new_account("bob");
		auto id = env.mint(alice, 2);
		env.registry.set_approval_for_all(alice.address(), bob.address(), true);

		env.deposit(bob, { id }).expect("deposit on behalf failed");
		VI_PANIC(env.engine.balance_of(alice.address()) == algorithm::rank::amount_for(2), "prior owner was not credited");
		VI_PANIC(env.engine.balance_of(bob.address()) == 0, "caller must not be credited");
		VI_PANIC(env.engine.nonce_of(bob.address()) == 1 && env.engine.nonce_of(alice.address()) == 0, "nonce belongs to the caller");
		env.verify();
	}
	/* per-item grants, blanket grants and missing grants */
	static void custody_authorization()
	{
		environment env;
		auto alice = generators::new_account("alice");
		auto bob = generators::new_account("bob");
		auto granted = env.mint(alice, 0);
		auto blanket = env.mint(alice, 1);
		auto denied = env.mint(alice, 2);

		env.registry.approve(alice.address(), bob.address(), granted).expect("approval failed");
		env.deposit(bob, { granted }).expect("per-item grant rejected");
		VI_PANIC(env.owner_of(granted) == env.engine.address(), "granted item not held");

		auto missing = env.deposit(bob, { denied });
		VI_PANIC(generators::fails_with(missing, error_code::not_authorized), "ungranted deposit accepted");
		VI_PANIC(env.owner_of(denied) == alice.address(), "ungranted item moved");

		env.registry.set_approval_for_all(alice.address(), bob.address(), true);
		env.deposit(bob, { blanket }).expect("blanket grant rejected");
		env.registry.set_approval_for_all(alice.address(), bob.address(), false);

		auto revoked = env.deposit(bob, { denied });
		VI_PANIC(generators::fails_with(revoked, error_code::not_authorized), "revoked grant accepted");

		auto unknown = env.deposit(alice, { uint256_t(9999) });
		VI_PANIC(generators::fails_with(unknown, error_code::item_not_found), "unknown item accepted");
		VI_PANIC(env.engine.balance_of(alice.address()) == algorithm::rank::amount_for(0) + algorithm::rank::amount_for(1), "owner credit mismatch");
		env.verify();
	}
	/* a failing item aborts the whole batch */
	static void conversion_batch_atomicity()
	{
		environment env;
		auto alice = generators::new_account("alice");
		auto bob = generators::new_account("bob");
		auto first = env.mint(alice, 0);
		auto second = env.mint(alice, 3);
		auto foreign = env.mint(bob, 1);

		auto batch = env.deposit(alice, { first, second, foreign });
		VI_PANIC(generators::fails_with(batch, error_code::not_authorized), "batch with foreign item accepted");
		VI_PANIC(env.engine.balance_of(alice.address()) == 0 && env.engine.balance_of(bob.address()) == 0, "partial credit after failed batch");
		VI_PANIC(env.engine.total_issued() == 0, "partial issuance after failed batch");
		VI_PANIC(env.owner_of(first) == alice.address() && env.owner_of(second) == alice.address(), "partial custody after failed batch");
		VI_PANIC(env.engine.nonce_of(alice.address()) == 0, "nonce changed after failed batch");
		VI_PANIC(env.registry.depth() == 0, "registry checkpoint leaked");

		auto empty = env.deposit(alice, { });
		VI_PANIC(generators::fails_with(empty, error_code::invalid_request), "empty batch accepted");

		auto duplicate = env.deposit(alice, { first, first });
		VI_PANIC(!duplicate && env.owner_of(first) == alice.address(), "duplicate batch accepted");

		env.deposit(alice, { first, second }).expect("valid batch rejected");
		VI_PANIC(env.engine.balance_of(alice.address()) == algorithm::rank::amount_for(0) + algorithm::rank::amount_for(3), "batch credit mismatch");
		env.verify();
	}
	/* maximal rank consumes the whole supply ceiling */
	static void conversion_supply_ceiling()
	{
		environment env;
		auto alice = generators::new_account("alice");
		auto bob = generators::new_account("bob");
		auto maximal = env.mint(alice, algorithm::rank::max_rank());
		auto smallest = env.mint(bob, 0);

		env.deposit(alice, { maximal }).expect("maximal deposit failed");
		VI_PANIC(env.engine.total_issued() == env.engine.max_supply(), "supply must be exhausted");

		auto overflow = env.deposit(bob, { smallest });
		VI_PANIC(generators::fails_with(overflow, error_code::supply_ceiling_exceeded), "deposit above ceiling accepted");
		VI_PANIC(env.owner_of(smallest) == bob.address(), "rejected item moved");

		env.redeem(alice, maximal).expect("maximal redemption failed");
		env.deposit(bob, { smallest }).expect("deposit below ceiling rejected");
		env.verify();
	}
	/* pairwise merge ordering and custody */
	static void merge_composite()
	{
		environment env;
		auto alice = generators::new_account("alice");
		auto bob = generators::new_account("bob");
		auto carol = generators::new_account("carol");
		auto keep = env.mint(bob, 0);
		auto burn = env.mint(alice, 0);
		auto outside = env.mint(alice, 0);

		auto reversed = env.composite(carol, burn, keep);
		VI_PANIC(generators::fails_with(reversed, error_code::invalid_order), "reversed merge accepted");

		auto same = env.composite(carol, keep, keep);
		VI_PANIC(generators::fails_with(same, error_code::invalid_order), "self merge accepted");

		auto external = env.composite(carol, keep, outside);
		VI_PANIC(generators::fails_with(external, error_code::not_in_custody), "merge of external items accepted");

		env.deposit(bob, { keep }).expect("deposit failed");
		env.deposit(alice, { burn }).expect("deposit failed");

		auto receipt = env.composite(carol, keep, burn).expect("merge failed");
		auto merged = env.registry.get_item(keep).expect("kept item missing");
		VI_PANIC(merged.rank == 1, "kept item rank mismatch");
		VI_PANIC(!env.registry.get_item(burn), "burned item still exists");

		auto* event = receipt.find_event<transactions::composite>();
		VI_PANIC(event != nullptr && (*event)[2].as_uint8() == 1, "composite event mismatch");

		auto short_redeem = env.redeem(bob, keep);
		VI_PANIC(generators::fails_with(short_redeem, error_code::insufficient_balance), "redemption charged at the deposit rank");
		VI_PANIC(env.owner_of(keep) == env.engine.address(), "item left custody after failed redemption");

		env.transfer(alice, bob.address(), algorithm::rank::amount_for(0)).expect("transfer failed");
		env.redeem(bob, keep).expect("redemption at the current rank failed");
		VI_PANIC(env.engine.balance_of(bob.address()) == 0 && env.engine.total_issued() == 0, "current rank redemption mismatch");
		env.verify();
	}
	/* registry level merge compatibility */
	static void merge_composite_registry()
	{
		environment env;
		auto alice = generators::new_account("alice");
		auto low = env.mint(alice, 0);
		auto high = env.mint(alice, 1);
		auto single_a = env.mint(alice, algorithm::rank::aggregate_rank());
		auto single_b = env.mint(alice, algorithm::rank::aggregate_rank());
		env.deposit(alice, { low, high }).expect("deposit failed");

		auto mismatch = env.composite(alice, low, high);
		VI_PANIC(generators::fails_with(mismatch, error_code::registry_rejected), "rank mismatch accepted");
		VI_PANIC(env.registry.get_item(low).expect("item missing").rank == 0, "rejected merge changed rank");

		env.deposit(alice, { single_a, single_b }).expect("single tier deposit failed");
		auto single = env.composite(alice, single_a, single_b);
		VI_PANIC(generators::fails_with(single, error_code::registry_rejected), "single tier pair merge accepted");
		VI_PANIC(env.registry.get_item(single_b).expect("item missing").exists, "rejected merge consumed an item");
		env.verify();
	}
	/* 64 single tier items aggregate into one maximal item */
	static void merge_aggregate()
	{
		auto* term = console::get();
		environment env;
		vector<account> users;
		vector<algorithm::item_id> ids;
		for (size_t i = 0; i < algorithm::rank::aggregate_size(); i++)
		{
			users.push_back(generators::new_account("depositor:" + to_string((uint64_t)i)));
			ids.push_back(env.mint(users.back(), algorithm::rank::aggregate_rank()));
		}

		for (size_t i = 0; i < ids.size(); i++)
			env.deposit(users[i], { ids[i] }).expect("single tier deposit failed");
		VI_PANIC(env.engine.total_issued() == env.engine.max_supply(), "aggregate inputs must exhaust the supply");

		auto caller = generators::new_account("aggregator");
		auto wrong_size = env.aggregate(caller, vector<algorithm::item_id>(ids.begin(), ids.end() - 1));
		VI_PANIC(generators::fails_with(wrong_size, error_code::invalid_request), "short aggregate accepted");

		auto reordered = ids;
		std::swap(reordered[0], reordered[17]);
		auto not_minimal = env.aggregate(caller, reordered);
		VI_PANIC(generators::fails_with(not_minimal, error_code::invalid_order), "non minimal first item accepted");

		auto receipt = env.aggregate(caller, ids).expect("aggregate failed");
		auto survivor = env.registry.get_item(ids.front()).expect("survivor missing");
		VI_PANIC(survivor.rank == algorithm::rank::max_rank(), "survivor must reach the maximal rank");
		VI_PANIC(survivor.owner == env.engine.address(), "survivor left custody");
		for (size_t i = 1; i < ids.size(); i++)
			VI_PANIC(!env.registry.get_item(ids[i]), "aggregated item still exists");

		auto* event = receipt.find_event<transactions::aggregate>();
		VI_PANIC(event != nullptr && (*event)[0].as_uint256() == ids.front() && (*event)[1].as_uint64() == 63, "aggregate event mismatch");
		VI_PANIC(env.engine.total_issued() == env.engine.max_supply(), "aggregation must not change supply");

		auto locked = env.redeem(users.front(), ids.front());
		VI_PANIC(generators::fails_with(locked, error_code::insufficient_balance), "maximal item redeemed by a single depositor");

		auto consumed = env.redeem(users.back(), ids.back());
		VI_PANIC(generators::fails_with(consumed, error_code::item_not_found), "consumed item redeemed");

		auto late = generators::new_account("late");
		auto extra = env.mint(late, 0);
		auto overflow = env.deposit(late, { extra });
		VI_PANIC(generators::fails_with(overflow, error_code::supply_ceiling_exceeded), "deposit after aggregation accepted");
		term->jwrite_line(*survivor.as_schema());
		env.verify();
	}
	/* aggregate requires custody of every item */
	static void merge_aggregate_custody()
	{
		environment env;
		auto alice = generators::new_account("alice");
		vector<algorithm::item_id> ids;
		for (size_t i = 0; i < algorithm::rank::aggregate_size(); i++)
			ids.push_back(env.mint(alice, algorithm::rank::aggregate_rank()));

		env.deposit(alice, vector<algorithm::item_id>(ids.begin(), ids.end() - 1)).expect("deposit failed");
		auto missing = env.aggregate(alice, ids);
		VI_PANIC(generators::fails_with(missing, error_code::not_in_custody), "aggregate of external item accepted");
		for (size_t i = 0; i < ids.size() - 1; i++)
			VI_PANIC(env.registry.get_item(ids[i]).expect("item missing").rank == algorithm::rank::aggregate_rank(), "rejected aggregate changed rank");
		env.verify();
	}
	/* value transfers are never accepted */
	static void guard_unsolicited_value()
	{
		environment env;
		auto alice = generators::new_account("alice");
		auto plain = env.engine.accept_value(alice.address(), 1000, std::string_view());
		VI_PANIC(generators::fails_with(plain, error_code::unsolicited_value_rejected), "plain value accepted");

		auto with_data = env.engine.accept_value(alice.address(), 1000, "payload");
		VI_PANIC(generators::fails_with(with_data, error_code::unsolicited_value_rejected), "value with data accepted");
		VI_PANIC(env.engine.total_issued() == 0, "value changed the ledger");
	}
	/* receive hook accepts the registry only */
	static void guard_receive_hook()
	{
		environment env;
		auto alice = generators::new_account("alice");
		auto bob = generators::new_account("bob");
		auto id = env.mint(alice, 5);

		auto direct = env.engine.on_item_received(alice.address(), alice.address(), alice.address(), id, std::string_view());
		VI_PANIC(generators::fails_with(direct, error_code::not_registry), "direct hook call accepted");
		VI_PANIC(env.engine.balance_of(alice.address()) == 0, "direct hook call credited");

		env.registry.safe_transfer(alice.address(), alice.address(), env.engine.address(), id).expect("safe transfer into custody failed");
		VI_PANIC(env.engine.balance_of(alice.address()) == algorithm::rank::amount_for(5), "hook did not credit sender");
		VI_PANIC(env.owner_of(id) == env.engine.address(), "hook transfer not held");

		env.redeem(alice, id).expect("redemption of hook deposit failed");
		VI_PANIC(env.owner_of(id) == alice.address(), "hook deposit not returned");

		auto maximal = env.mint(bob, algorithm::rank::max_rank());
		env.deposit(bob, { maximal }).expect("maximal deposit failed");

		auto overflow = env.registry.safe_transfer(alice.address(), alice.address(), env.engine.address(), id);
		VI_PANIC(generators::fails_with(overflow, error_code::registry_rejected), "hook deposit above ceiling accepted");
		VI_PANIC(env.owner_of(id) == alice.address(), "rejected hook deposit moved the item");
		env.verify();
	}
	/* nested entry during a custody transfer */
	static void guard_reentrancy()
	{
		struct reentrant_receiver final : ledger::item_receiver
		{
			ledger::engine* engine = nullptr;
			account* user = nullptr;
			algorithm::item_id target = 0;
			error_code nested_submit = error_code::none;
			error_code nested_value = error_code::none;
			size_t calls = 0;

			expects_lr<void> on_item_received(const algorithm::pubkeyhash_t& caller, const algorithm::pubkeyhash_t& initiator, const algorithm::pubkeyhash_t& from, const algorithm::item_id& id, const std::string_view& data) override
			{
				++calls;
				transactions::deposit request;
				request.ids = { target };
				VI_PANIC(request.sign(user->wallet.secret_key, user->nonce), "authentication failed");

				auto status = engine->submit(request);
				nested_submit = status ? error_code::none : status.error().code();

				auto value = engine->accept_value(from, 1, std::string_view());
				nested_value = value ? error_code::none : value.error().code();
				if (!status)
					return status.error();

				return expectation::met;
			}
		};

		environment env;
		auto alice = generators::new_account("alice");
		auto id = env.mint(alice, 3);
		auto other = env.mint(alice, 0);
		env.deposit(alice, { id }).expect("deposit failed");

		reentrant_receiver receiver;
		receiver.engine = &env.engine;
		receiver.user = &alice;
		receiver.target = other;
		env.registry.bind_receiver(alice.address(), &receiver);

		auto redemption = env.redeem(alice, id);
		VI_PANIC(receiver.calls == 1, "receiver hook not called");
		VI_PANIC(receiver.nested_submit == error_code::reentrancy_rejected, "nested submit accepted");
		VI_PANIC(receiver.nested_value == error_code::reentrancy_rejected, "nested value accepted");
		VI_PANIC(generators::fails_with(redemption, error_code::registry_rejected), "outer request survived nested entry");
		VI_PANIC(env.owner_of(id) == env.engine.address() && env.owner_of(other) == alice.address(), "custody changed after nested entry");
		VI_PANIC(env.engine.balance_of(alice.address()) == algorithm::rank::amount_for(3), "balance changed after nested entry");
		VI_PANIC(env.engine.nonce_of(alice.address()) == 1, "nonce changed after nested entry");

		env.registry.bind_receiver(alice.address(), nullptr);
		env.redeem(alice, id).expect("redemption without receiver failed");
		env.verify();
	}
	/* signed request nonces */
	static void ledger_nonce()
	{
		environment env;
		auto alice = generators::new_account("alice");
		auto id = env.mint(alice, 1);

		transactions::deposit unsigned_request;
		unsigned_request.ids = { id };
		auto unsigned_result = env.engine.submit(unsigned_request);
		VI_PANIC(generators::fails_with(unsigned_result, error_code::invalid_request), "unsigned request accepted");

		transactions::deposit ahead;
		ahead.ids = { id };
		VI_PANIC(ahead.sign(alice.wallet.secret_key, 5), "authentication failed");
		auto ahead_result = env.engine.submit(ahead);
		VI_PANIC(generators::fails_with(ahead_result, error_code::invalid_request), "future nonce accepted");

		auto failing = env.redeem(alice, id);
		VI_PANIC(generators::fails_with(failing, error_code::not_in_custody), "redemption of external item accepted");
		VI_PANIC(env.engine.nonce_of(alice.address()) == 0, "failed request changed the nonce");

		transactions::deposit request;
		request.ids = { id };
		VI_PANIC(request.sign(alice.wallet.secret_key, alice.nonce), "authentication failed");
		auto message = request.as_message();
		env.engine.submit(std::string_view(message.data)).expect("encoded request failed");
		VI_PANIC(env.engine.nonce_of(alice.address()) == 1, "nonce was not incremented");

		auto replay = env.engine.submit(std::string_view(message.data));
		VI_PANIC(generators::fails_with(replay, error_code::invalid_request), "replayed request accepted");
		VI_PANIC(env.engine.get_sequence() == 1, "sequence mismatch");
		env.verify();
	}
	/* fungible transfers between accounts */
	static void ledger_transfer()
	{
		environment env;
		auto alice = generators::new_account("alice");
		auto bob = generators::new_account("bob");
		auto id = env.mint(alice, 2);
		env.deposit(alice, { id }).expect("deposit failed");

		auto amount = algorithm::rank::amount_for(2);
		auto half = amount / uint256_t(2);
		auto receipt = env.transfer(alice, bob.address(), half).expect("transfer failed");
		VI_PANIC(env.engine.balance_of(alice.address()) == amount - half && env.engine.balance_of(bob.address()) == half, "transfer balance mismatch");
		VI_PANIC(receipt.find_events<states::account_balance>().size() == 2, "transfer events mismatch");

		auto excess = env.transfer(bob, alice.address(), amount);
		VI_PANIC(generators::fails_with(excess, error_code::insufficient_balance), "overdraft accepted");

		auto self = env.transfer(alice, alice.address(), 1);
		VI_PANIC(generators::fails_with(self, error_code::invalid_request), "self transfer accepted");
		VI_PANIC(env.engine.total_issued() == amount, "transfer changed supply");
		env.verify();
	}
	/* registry checkpoints and token metadata */
	static void ledger_registry()
	{
		auto* term = console::get();
		environment env;
		auto alice = generators::new_account("alice");
		auto bob = generators::new_account("bob");
		auto id = env.mint(alice, 0);

		env.registry.checkpoint();
		env.mint(alice, 1);
		env.registry.transfer(alice.address(), alice.address(), bob.address(), id).expect("transfer failed");
		VI_PANIC(env.owner_of(id) == bob.address(), "transfer did not move the item");
		VI_PANIC(env.registry.size() == 2 && env.registry.depth() == 1, "registry checkpoint mismatch");
		env.registry.revert();
		VI_PANIC(env.registry.size() == 1 && env.owner_of(id) == alice.address(), "registry revert mismatch");

		VI_PANIC(env.engine.name() == "Black Check", "token name mismatch");
		VI_PANIC(env.engine.symbol() == "$BLKCHK", "token symbol mismatch");
		VI_PANIC(env.engine.decimals() == 18, "token decimals mismatch");
		VI_PANIC(env.engine.max_supply() == algorithm::rank::unit(), "max supply mismatch");
		VI_PANIC(env.engine.address() != env.registry.address(), "engine shares the registry identity");
		term->jwrite_line(*env.engine.as_schema());
	}
};

class runners
{
public:
	/* test case runner for regressions */
	static int regression(inline_args& args)
	{
		vector<std::pair<std::string_view, std::function<void()>>> cases =
		{
			{ "rank / amounts", &tests::rank_amounts },
			{ "cryptography / signatures", &tests::cryptography_signatures },
			{ "generic / message serialization", &tests::generic_message_serialization },
			{ "conversion / deposit", &tests::conversion_deposit },
			{ "conversion / round trip", &tests::conversion_round_trip },
			{ "conversion / deposit on behalf", &tests::conversion_deposit_on_behalf },
			{ "conversion / batch atomicity", &tests::conversion_batch_atomicity },
			{ "conversion / supply ceiling", &tests::conversion_supply_ceiling },
			{ "custody / authorization", &tests::custody_authorization },
			{ "merge / composite", &tests::merge_composite },
			{ "merge / composite registry", &tests::merge_composite_registry },
			{ "merge / aggregate", &tests::merge_aggregate },
			{ "merge / aggregate custody", &tests::merge_aggregate_custody },
			{ "guard / unsolicited value", &tests::guard_unsolicited_value },
			{ "guard / receive hook", &tests::guard_receive_hook },
			{ "guard / reentrancy", &tests::guard_reentrancy },
			{ "ledger / nonce", &tests::ledger_nonce },
			{ "ledger / transfer", &tests::ledger_transfer },
			{ "ledger / registry", &tests::ledger_registry },
		};

		auto* term = console::get();
		for (size_t i = 0; i < cases.size(); i++)
		{
			auto& [name, function] = cases[i];
			term->write_color(std_color::black, std_color::yellow);
			term->fwrite("  ===>  %s  <===  ", name.data());
			term->clear_color();
			term->write_char('\n');
			term->capture_time();

			function();

			double time = term->get_captured_time();
			term->write_color(std_color::white, std_color::dark_green);
			term->fwrite("  TEST PASS %.1fms %.2f%%  ", time, 100.0 * (double)(i + 1) / (double)cases.size());
			term->clear_color();
			term->write("\n\n");
		}
		return 0;
	}
};

int main(int argc, char* argv[])
{
	vitex::runtime scope;
	inline_args args = os::process::parse_args(argc, argv, (size_t)args_format::key | (size_t)args_format::key_value);
	protocol params = protocol(args);
	auto* term = console::get();
	term->show();

	int bad_entrypoint_exit_code = 0x39ce8025;
	int exit_code = bad_entrypoint_exit_code;
	auto test = args.get("test");
	if (test == "regression")
		exit_code = runners::regression(args);

	VI_PANIC(exit_code != bad_entrypoint_exit_code, "must provide a \"test\" flag (string in [regression])");
	return exit_code;
}
