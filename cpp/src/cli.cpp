#include "anchor/cli.hpp"
#include "anchor/calendar.hpp"
#include "anchor/calendar_whitelist.hpp"
#include "anchor/chain_verifier.hpp"
#include "anchor/config.hpp"
#include "anchor/crypto.hpp"
#include "anchor/http_client.hpp"
#include "anchor/logging.hpp"
#include "anchor/proof_file.hpp"
#include "anchor/prune.hpp"
#include "anchor/quorum_submitter.hpp"
#include "anchor/rate_limiter.hpp"
#include "anchor/stamp.hpp"
#include "anchor/timestamp_cache.hpp"
#include "anchor/upgrade.hpp"
#include "anchor/verify.hpp"
#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <filesystem>
#include <fstream>
#include <iostream>

namespace anchor::cli
{

	namespace
	{
		using std::chrono::milliseconds;

		milliseconds to_millis(double seconds)
		{
			return milliseconds(static_cast<int64_t>(seconds * 1000.0));
		}

		// Long-lived collaborators built once from the effective config
		struct Services
		{
			std::shared_ptr<HttpClient> http;
			CalendarFactory calendars;
			std::shared_ptr<TimestampCache> cache;
			std::shared_ptr<RateLimiter> limiter;
			CalendarWhitelist whitelist;
		};

		Result<Services> make_services(const AnchorConfig &cfg)
		{
			Services s;

			HttpClientConfig http_cfg;
			http_cfg.user_agent = cfg.network.user_agent;
			if (!cfg.network.socks5_proxy.empty())
			{
				auto proxy = Socks5Proxy::parse(cfg.network.socks5_proxy);
				if (!proxy)
					return std::unexpected(proxy.error());
				http_cfg.proxy = *proxy;
			}
			s.http = std::make_shared<BeastHttpClient>(http_cfg);
			s.calendars = remote_calendar_factory(s.http);

			if (cfg.cache.enabled)
			{
				auto cache = RocksDbTimestampCache::open(cfg.cache);
				if (cache)
					s.cache = std::move(*cache);
				else
					spdlog::warn("Continuing without timestamp cache: {}", cache.error().what());
			}

			s.limiter = std::make_shared<RateLimiter>(
				RateLimiter::Config{cfg.calendars.requests_per_second, cfg.calendars.burst});

			if (!cfg.calendars.no_default_whitelist)
				s.whitelist = CalendarWhitelist::defaults();
			for (const auto &url : cfg.calendars.whitelist)
			{
				if (auto res = s.whitelist.add(url); !res)
					return std::unexpected(res.error());
			}
			return s;
		}

		UpgradeOptions upgrade_options(const AnchorConfig &cfg, const Services &s, std::vector<std::string> calendar_urls)
		{
			UpgradeOptions opts;
			opts.calendar_urls = std::move(calendar_urls);
			opts.whitelist = s.whitelist;
			opts.wait = cfg.upgrade.wait;
			opts.wait_interval = to_millis(cfg.upgrade.wait_interval_seconds);
			return opts;
		}

		std::unique_ptr<BitcoinRpcVerifier> make_node_verifier(const AnchorConfig &cfg, const Services &s)
		{
			if (!cfg.bitcoin.query_local_node)
				return nullptr;
			BitcoinNodeConfig node;
			if (auto net = parse_bitcoin_network(cfg.bitcoin.network))
				node.network = *net;
			node.url = cfg.bitcoin.node_url;
			node.cookie_file = cfg.bitcoin.cookie_file;
			return std::make_unique<BitcoinRpcVerifier>(node, s.http);
		}

		int stamp_command(const AnchorConfig &cfg, Services &s, const std::vector<std::string> &files)
		{
			std::vector<DetachedTimestampFile> proofs;

			auto add_stream = [&](std::istream &in, const std::string &name) -> bool
			{
				auto proof = DetachedTimestampFile::from_stream(in);
				if (!proof)
				{
					spdlog::error("Could not read {}: {}", name, proof.error().what());
					return false;
				}
				proofs.push_back(std::move(*proof));
				return true;
			};

			if (files.empty())
			{
				if (!add_stream(std::cin, "<stdin>"))
					return 1;
			}
			for (const auto &path : files)
			{
				std::ifstream in(path, std::ios::binary);
				if (!in.is_open())
				{
					spdlog::error("Could not open {}", path);
					return 1;
				}
				if (!add_stream(in, path))
					return 1;
			}

			QuorumConfig quorum;
			quorum.calendar_urls = cfg.calendars.urls.empty() ? default_calendar_urls() : cfg.calendars.urls;
			quorum.m = cfg.calendars.m;
			quorum.timeout = to_millis(cfg.calendars.timeout_seconds);

			std::optional<UpgradeOptions> wait;
			if (cfg.upgrade.wait)
				wait = upgrade_options(cfg, s, {});

			Stamper stamper(s.calendars, s.cache, s.limiter);
			if (auto merged = stamper.stamp(proofs, quorum, wait); !merged)
			{
				spdlog::error("{}", merged.error().what());
				return 1;
			}

			if (files.empty())
			{
				auto bytes = proofs.front().serialize();
				if (!bytes)
				{
					spdlog::error("{}", bytes.error().what());
					return 1;
				}
				std::cout.write(reinterpret_cast<const char *>(bytes->data()), static_cast<std::streamsize>(bytes->size()));
				std::cout.flush();
				return std::cout ? 0 : 1;
			}

			for (std::size_t i = 0; i < files.size(); ++i)
			{
				if (auto res = write_new_proof_file(files[i] + ".ots", proofs[i]); !res)
				{
					spdlog::error("{}", res.error().what());
					return 1;
				}
			}
			return 0;
		}

		int upgrade_command(const AnchorConfig &cfg, Services &s,
							const std::vector<std::string> &files,
							const std::vector<std::string> &calendar_urls,
							bool dry_run)
		{
			Upgrader upgrader(s.calendars, s.cache, s.limiter);
			auto opts = upgrade_options(cfg, s, calendar_urls);

			for (const auto &path : files)
			{
				spdlog::debug("Upgrading {}", path);
				auto proof = read_proof_file(path);
				if (!proof)
				{
					spdlog::error("{}", proof.error().what());
					return 1;
				}

				bool changed = upgrader.upgrade(*proof->timestamp, opts);
				if (changed && !dry_run)
				{
					spdlog::debug("Got new timestamp data for {}", path);
					if (auto res = replace_proof_file(path, *proof); !res)
					{
						spdlog::error("{}", res.error().what());
						return 1;
					}
				}

				if (proof->timestamp->is_complete())
				{
					spdlog::info("Success! Timestamp complete");
				}
				else
				{
					spdlog::warn("Failed! Timestamp not complete");
					return 1;
				}
			}
			return 0;
		}

		int verify_command(const AnchorConfig &cfg, Services &s,
						   const std::string &path,
						   const std::string &target,
						   const std::string &hex_digest)
		{
			auto proof = read_proof_file(path);
			if (!proof)
			{
				spdlog::error("{}", proof.error().what());
				return 1;
			}

			if (!hex_digest.empty())
			{
				auto digest = crypto::Hex::decode(hex_digest);
				if (!digest)
				{
					spdlog::error("Digest must be hexadecimal");
					return 1;
				}
				if (*digest != proof->file_digest())
				{
					spdlog::error("Digest provided does not match digest in timestamp, {} ({})",
								  crypto::Hex::encode(proof->file_digest()), proof->file_hash_op.to_string());
					return 1;
				}
			}
			else
			{
				std::string target_path = target;
				if (target_path.empty())
				{
					if (!path.ends_with(".ots"))
					{
						spdlog::error("Timestamp filename does not end in .ots");
						return 1;
					}
					target_path = path.substr(0, path.size() - 4);
					spdlog::info("Assuming target filename is {}", target_path);
				}

				std::ifstream in(target_path, std::ios::binary);
				if (!in.is_open())
				{
					spdlog::error("Could not open target: {}", target_path);
					return 1;
				}
				auto actual = DetachedTimestampFile::from_stream(in);
				if (!actual)
				{
					spdlog::error("{}", actual.error().what());
					return 1;
				}
				spdlog::debug("Got digest {}", crypto::Hex::encode(actual->file_digest()));
				if (actual->file_digest() != proof->file_digest())
				{
					spdlog::debug("Expected digest {}", crypto::Hex::encode(proof->file_digest()));
					spdlog::error("File does not match original!");
					return 1;
				}
			}

			Upgrader upgrader(s.calendars, s.cache, s.limiter);
			upgrader.upgrade(*proof->timestamp, upgrade_options(cfg, s, {}));

			auto node = make_node_verifier(cfg, s);
			std::unique_ptr<EsploraExplorer> explorer;
			if (cfg.bitcoin.query_explorer > 0)
				explorer = std::make_unique<EsploraExplorer>(cfg.bitcoin.explorer_url, s.http);

			VerifyOptions opts{node.get(), explorer.get(), cfg.bitcoin.query_explorer};
			auto earliest = verify_timestamp(*proof->timestamp, opts);
			if (!earliest)
			{
				spdlog::warn("Could not verify any attestation");
				return 2;
			}
			std::cout << "Success! Bitcoin block attests existence as of " << format_block_time(*earliest) << std::endl;
			return 0;
		}

		int info_command(const std::string &path, int verbosity)
		{
			auto proof = read_proof_file(path);
			if (!proof)
			{
				spdlog::error("{}", proof.error().what());
				return 1;
			}
			std::cout << "File " << proof->file_hash_op.to_string() << " hash: "
					  << crypto::Hex::encode(proof->file_digest()) << "\n";
			std::cout << "Timestamp:\n"
					  << proof->timestamp->str_tree(0, verbosity) << std::flush;
			return 0;
		}

		int prune_command(const AnchorConfig &cfg, Services &s,
						  const std::string &path,
						  const std::vector<std::string> &verify_specs,
						  bool no_verify,
						  const std::vector<std::string> &discard_specs)
		{
			PruneOptions opts;
			if (!verify_specs.empty())
			{
				auto kinds = parse_verify_specs(verify_specs);
				if (!kinds)
				{
					spdlog::error("{}", kinds.error().what());
					return 1;
				}
				opts.verify = *kinds;
			}
			else if (no_verify)
			{
				opts.verify.clear();
			}

			if (!discard_specs.empty())
			{
				auto discard = parse_discard_specs(discard_specs);
				if (!discard)
				{
					spdlog::error("{}", discard.error().what());
					return 1;
				}
				opts.discard = *discard;
			}

			auto proof = read_proof_file(path);
			if (!proof)
			{
				spdlog::error("{}", proof.error().what());
				return 1;
			}

			auto node = make_node_verifier(cfg, s);
			auto outcome = prune_timestamp(*proof->timestamp, opts, node.get());
			if (!outcome)
			{
				spdlog::error("{}", outcome.error().what());
				return 1;
			}
			if (outcome->prunable)
			{
				spdlog::warn("Failed! All attestations have been discarded");
				return 1;
			}
			if (!outcome->changed)
			{
				spdlog::warn("Failed! Nothing has been discarded");
				return 1;
			}

			if (auto res = replace_proof_file(path, *proof); !res)
			{
				spdlog::error("{}", res.error().what());
				return 1;
			}
			spdlog::info("Success! Timestamp pruned");
			return 0;
		}
	} // namespace

	int run(int argc, char *argv[])
	{
		CLI::App app{"anchor: create and verify blockchain-anchored timestamps"};
		app.require_subcommand(1);

		int verbose = 0;
		int quiet = 0;
		std::string config_path;
		std::vector<std::string> whitelist;
		std::string cache_path;
		std::string bitcoin_node;
		std::size_t query_explorer = 0;
		double wait_interval = 0;
		std::string socks5_proxy;

		app.add_flag("-v,--verbose", verbose, "Be more verbose. Both -v and -q may be used multiple times");
		app.add_flag("-q,--quiet", quiet, "Be more quiet");
		app.add_option("--config", config_path, "Path to config TOML (default: anchor.toml if present)");
		app.add_option("-l,--whitelist", whitelist, "Add a calendar to the whitelist");
		auto no_default_wl = app.add_flag("--no-default-whitelist", "Do not load the default remote calendar whitelist");
		auto cache_opt = app.add_option("--cache", cache_path, "Location of the timestamp cache");
		auto no_cache = app.add_flag("--no-cache", "Disable the timestamp cache");
		auto testnet = app.add_flag("--btc-testnet", "Use Bitcoin testnet rather than mainnet");
		auto regtest = app.add_flag("--btc-regtest", "Use Bitcoin regtest rather than mainnet");
		testnet->excludes(regtest);
		auto no_bitcoin = app.add_flag("--no-bitcoin", "Do not query a local Bitcoin node");
		auto node_opt = app.add_option("--bitcoin-node", bitcoin_node, "Bitcoin node URL (default: local node)");
		auto explorer_opt = app.add_option("--query-explorer", query_explorer,
										   "Confirm up to N Bitcoin blocks with the block explorer");
		auto wait_flag = app.add_flag("-w,--wait", "When creating, upgrading or verifying, wait until a complete timestamp is available");
		auto interval_opt = app.add_option("--wait-interval", wait_interval, "How often to poll calendars for upgrades, in seconds");
		auto socks_opt = app.add_option("--socks5-proxy", socks5_proxy, "Route all traffic through a SOCKS5 proxy (host[:port])");

		std::vector<std::string> stamp_files;
		std::vector<std::string> stamp_calendars;
		std::size_t stamp_m = 0;
		double stamp_timeout = 0;
		auto stamp_cmd = app.add_subcommand("stamp", "Timestamp files");
		stamp_cmd->add_option("files", stamp_files, "Files to timestamp (default: stdin)");
		auto stamp_cal_opt = stamp_cmd->add_option("-c,--calendar", stamp_calendars, "Create timestamp with the aid of a remote calendar");
		auto stamp_m_opt = stamp_cmd->add_option("-m", stamp_m, "Commitments are sent to remote calendars; succeed when at least M respond");
		auto stamp_timeout_opt = stamp_cmd->add_option("--timeout", stamp_timeout, "Timeout before giving up on a calendar, in seconds");

		std::vector<std::string> upgrade_files;
		std::vector<std::string> upgrade_calendars;
		bool dry_run = false;
		auto upgrade_cmd = app.add_subcommand("upgrade", "Upgrade remote calendar timestamps to be locally verifiable");
		upgrade_cmd->add_option("files", upgrade_files, "Existing timestamp(s)")->required();
		upgrade_cmd->add_option("-c,--calendar", upgrade_calendars, "Override calendars given in the timestamp");
		upgrade_cmd->add_flag("-n,--dry-run", dry_run, "Perform a trial upgrade without modifying the existing timestamp");

		std::string verify_path;
		std::string verify_target;
		std::string verify_digest;
		auto verify_cmd = app.add_subcommand("verify", "Verify a timestamp");
		verify_cmd->add_option("timestamp", verify_path, "Timestamp filename")->required();
		auto target_opt = verify_cmd->add_option("-f", verify_target, "Specify target file explicitly");
		auto digest_opt = verify_cmd->add_option("-d", verify_digest, "Verify a (hex-encoded) digest rather than a file");
		target_opt->excludes(digest_opt);

		std::string info_path;
		auto info_cmd = app.add_subcommand("info", "Show information on a timestamp");
		info_cmd->add_option("file", info_path, "Filename")->required();

		std::string prune_path;
		std::vector<std::string> prune_verify;
		std::vector<std::string> prune_discard;
		bool prune_no_verify = false;
		auto prune_cmd = app.add_subcommand("prune", "Prune a timestamp down to the best attestations");
		prune_cmd->add_option("timestamp", prune_path, "Timestamp filename")->required();
		auto verify_opt = prune_cmd->add_option("--verify", prune_verify, "Verify attestations of this NOTARYSPEC (btc); default btc");
		auto no_verify_opt = prune_cmd->add_flag("--no-verify", prune_no_verify, "Do not verify attestations");
		verify_opt->excludes(no_verify_opt);
		prune_cmd->add_option("--discard", prune_discard,
							  "Discard attestations of this NOTARYSPEC (btc, ltc, unknown, pending:*, pending:URI); default pending:*");

		auto cfg_cmd = app.add_subcommand("config-print", "Print the effective configuration as JSON");

		CLI11_PARSE(app, argc, argv);

		const int verbosity = verbose - quiet;
		logging::init(verbosity);

		Result<AnchorConfig> cfg_res = std::unexpected(AnchorError::internal("config not loaded"));
		if (!config_path.empty())
			cfg_res = ConfigLoader::load(config_path);
		else if (std::filesystem::exists("anchor.toml"))
			cfg_res = ConfigLoader::load("anchor.toml");
		else
			cfg_res = ConfigLoader::defaults();
		if (!cfg_res)
		{
			spdlog::error("{}", cfg_res.error().what());
			return 1;
		}
		AnchorConfig cfg = *cfg_res;

		// Flags given on the command line win over the file
		cfg.calendars.whitelist.insert(cfg.calendars.whitelist.end(), whitelist.begin(), whitelist.end());
		if (*no_default_wl)
			cfg.calendars.no_default_whitelist = true;
		if (*cache_opt)
			cfg.cache.path = cache_path;
		if (*no_cache)
			cfg.cache.enabled = false;
		if (*testnet)
			cfg.bitcoin.network = "testnet";
		if (*regtest)
			cfg.bitcoin.network = "regtest";
		if (*no_bitcoin)
			cfg.bitcoin.query_local_node = false;
		if (*node_opt)
			cfg.bitcoin.node_url = bitcoin_node;
		if (*explorer_opt)
			cfg.bitcoin.query_explorer = query_explorer;
		if (*wait_flag)
			cfg.upgrade.wait = true;
		if (*interval_opt)
			cfg.upgrade.wait_interval_seconds = wait_interval;
		if (*socks_opt)
			cfg.network.socks5_proxy = socks5_proxy;
		if (*stamp_cal_opt)
			cfg.calendars.urls = stamp_calendars;
		if (*stamp_m_opt)
			cfg.calendars.m = stamp_m;
		if (*stamp_timeout_opt)
			cfg.calendars.timeout_seconds = stamp_timeout;

		if (auto valid = ConfigLoader::validate(cfg); !valid)
		{
			spdlog::error("{}", valid.error().what());
			return 1;
		}

		if (*cfg_cmd)
		{
			std::cout << ConfigLoader::to_json(cfg).dump(2) << std::endl;
			return 0;
		}

		if (*info_cmd)
			return info_command(info_path, verbosity);

		auto services = make_services(cfg);
		if (!services)
		{
			spdlog::error("{}", services.error().what());
			return 1;
		}

		if (*stamp_cmd)
			return stamp_command(cfg, *services, stamp_files);
		if (*upgrade_cmd)
			return upgrade_command(cfg, *services, upgrade_files, upgrade_calendars, dry_run);
		if (*verify_cmd)
			return verify_command(cfg, *services, verify_path, verify_target, verify_digest);
		if (*prune_cmd)
			return prune_command(cfg, *services, prune_path, prune_verify, prune_no_verify, prune_discard);

		std::cout << app.help() << std::endl;
		return 0;
	}

} // namespace anchor::cli
