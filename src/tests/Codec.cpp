#include <gtest/gtest.h>
#include <array>
#include <cstddef>
#include <expected>
#include <memory>
#include <span>
#include <vector>

#include "../core/Match.hpp"
#include "../core/DuelRules.hpp"
#include "../debug/ScriptedDice.hpp"
#include "../net/codec.hpp"

using namespace duel::core;
using duel::core::net::DecodeCommand;
using duel::core::net::DecodedCommand;
using duel::core::net::ParseError;

namespace fb = duel::gen::net;

namespace
{
    constexpr ParticipantId Alice = 1001;
    constexpr ParticipantId Bob = 2002;

    inline std::span<const std::byte> AsBytes(const flatbuffers::DetachedBuffer& buf)
    {
        const uint8_t* p = buf.data();
        return {reinterpret_cast<const std::byte*>(p), buf.size()};
    }

    inline std::expected<DecodedCommand, ParseError> Decode(const flatbuffers::DetachedBuffer& buf)
    {
        return DecodeCommand(AsBytes(buf));
    }

    // Declare with raw stance bytes, for values the typed builder cannot produce
    inline flatbuffers::DetachedBuffer MakeRawDeclareFB(ContextKey ctx, std::vector<uint8_t> const& raw, uint64_t msg_id)
    {
        flatbuffers::FlatBufferBuilder fbb;
        flatbuffers::Offset<fb::Cmd_Declare> d = fb::CreateCmd_Declare(fbb, fbb.CreateVector(raw));
        flatbuffers::Offset<fb::CommandMsg> cm =
            fb::CreateCommandMsg(fbb, msg_id, ctx, fb::Command::Cmd_Declare, d.Union());
        flatbuffers::Offset<fb::Envelope> env = fb::CreateEnvelope(fbb, fb::Message::CommandMsg, cm.Union());
        fbb.Finish(env);
        return fbb.Release();
    }

    // CommandMsg of the given type whose command table is absent
    inline flatbuffers::DetachedBuffer MakeBodylessCommandFB(fb::Command type, uint64_t msg_id)
    {
        flatbuffers::FlatBufferBuilder fbb;
        flatbuffers::Offset<fb::CommandMsg> cm =
            fb::CreateCommandMsg(fbb, msg_id, /*context*/ 1, type, flatbuffers::Offset<void>());
        flatbuffers::Offset<fb::Envelope> env = fb::CreateEnvelope(fbb, fb::Message::CommandMsg, cm.Union());
        fbb.Finish(env);
        return fbb.Release();
    }

    // Envelope tagged CommandMsg without the message itself
    inline flatbuffers::DetachedBuffer MakeEmptyEnvelopeFB()
    {
        flatbuffers::FlatBufferBuilder fbb;
        flatbuffers::Offset<fb::Envelope> env =
            fb::CreateEnvelope(fbb, fb::Message::CommandMsg, flatbuffers::Offset<void>());
        fbb.Finish(env);
        return fbb.Release();
    }

    inline std::unique_ptr<MatchImpl> MakeMatchInPicking(std::vector<uint8_t> faces)
    {
        MatchConfig cfg{};
        cfg.best_of = 5;
        cfg.bait_switch = false;
        auto m = std::make_unique<MatchImpl>(31, Alice, Bob, cfg, std::make_unique<DuelRules>(),
                                             std::make_unique<debug::ScriptedDice>(std::move(faces)));
        EXPECT_EQ(m->Accept(Bob), MoveOutcome::MatchStarted);
        EXPECT_EQ(m->Declare(Alice, Stance::Bagr, Stance::Tigr), MoveOutcome::Applied);
        EXPECT_EQ(m->Declare(Bob, Stance::Radae, Stance::Riposje), MoveOutcome::PhaseAdvanced);
        return m;
    }
} // namespace

TEST(Codec, Decode_Match_Actions)
{
    std::array<Stance, 2> const pair{Stance::Darda, Stance::Tortad};
    auto const declare = Decode(net::BuildDeclare(7, pair, 11));
    ASSERT_TRUE(declare.has_value()) << declare.error().message;
    EXPECT_EQ(declare->msg_id, 11u);
    EXPECT_EQ(declare->context, 7u);
    auto const* action = std::get_if<MatchAction>(&declare->body);
    ASSERT_NE(action, nullptr);
    auto const* d = std::get_if<DeclareAction>(action);
    ASSERT_NE(d, nullptr);
    EXPECT_EQ(d->stances, (std::vector<Stance>{Stance::Darda, Stance::Tortad}));

    auto const sw = Decode(net::BuildSwitch(7, Stance::Tortad, Stance::Bagr, 12));
    ASSERT_TRUE(sw.has_value());
    auto const* s = std::get_if<SwitchAction>(&std::get<MatchAction>(sw->body));
    ASSERT_NE(s, nullptr);
    EXPECT_EQ(s->from, Stance::Tortad);
    EXPECT_EQ(s->to, Stance::Bagr);

    auto const pick = Decode(net::BuildPick(7, Stance::Riposje, 13));
    ASSERT_TRUE(pick.has_value());
    EXPECT_EQ(std::get<PickAction>(std::get<MatchAction>(pick->body)).stance, Stance::Riposje);

    auto const accept = Decode(net::BuildAccept(7, 14));
    ASSERT_TRUE(accept.has_value());
    EXPECT_TRUE(std::holds_alternative<AcceptAction>(std::get<MatchAction>(accept->body)));

    auto const pass = Decode(net::BuildPassSwitch(7, 15));
    ASSERT_TRUE(pass.has_value());
    EXPECT_TRUE(std::holds_alternative<PassSwitchAction>(std::get<MatchAction>(pass->body)));

    auto const cancel = Decode(net::BuildCancel(7, 16));
    ASSERT_TRUE(cancel.has_value());
    EXPECT_TRUE(std::holds_alternative<CancelAction>(std::get<MatchAction>(cancel->body)));
}

TEST(Codec, Decode_Host_Commands)
{
    auto const hello = Decode(net::BuildHello(Alice, 1));
    ASSERT_TRUE(hello.has_value());
    EXPECT_EQ(std::get<net::HelloCmd>(hello->body).participant, Alice);

    MatchConfig cfg{};
    cfg.best_of = 7;
    cfg.no_repeat = true;
    cfg.bait_switch = true;
    cfg.tie_policy = TiePolicy::ChallengerWins;
    auto const challenge = Decode(net::BuildChallenge(99, Bob, cfg, 2));
    ASSERT_TRUE(challenge.has_value());
    EXPECT_EQ(challenge->context, 99u);
    auto const& c = std::get<net::ChallengeCmd>(challenge->body);
    EXPECT_EQ(c.opponent, Bob);
    EXPECT_EQ(c.config.best_of, 7);
    EXPECT_TRUE(c.config.no_repeat);
    EXPECT_FALSE(c.config.adjacency_mod);
    EXPECT_TRUE(c.config.bait_switch);
    EXPECT_EQ(c.config.tie_policy, TiePolicy::ChallengerWins);

    // Out-of-range values still reach the rules, which report them
    auto const mod = Decode(net::BuildSetModifier(99, Bob, ModifierScope::Match, -5, 3));
    ASSERT_TRUE(mod.has_value());
    auto const& m = std::get<net::SetModifierCmd>(mod->body);
    EXPECT_EQ(m.target, Bob);
    EXPECT_EQ(m.scope, ModifierScope::Match);
    EXPECT_EQ(m.value, -5);

    EXPECT_TRUE(std::holds_alternative<net::ForceEndCmd>(Decode(net::BuildForceEnd(99, 4))->body));
    EXPECT_TRUE(std::holds_alternative<net::StatusCmd>(Decode(net::BuildStatus(99, 5))->body));
}

TEST(Codec, Rejects_Malformed_Input)
{
    std::array<std::byte, 2> const tiny{};
    auto const small = DecodeCommand(tiny);
    ASSERT_FALSE(small.has_value());
    EXPECT_EQ(small.error().message, "buffer too small");

    std::vector<std::byte> garbage(64, std::byte{0xFF});
    auto const junk = DecodeCommand(garbage);
    ASSERT_FALSE(junk.has_value());
    EXPECT_EQ(junk.error().message, "verification failed");

    auto const stance = Decode(MakeRawDeclareFB(7, {0, 9}, 1));
    ASSERT_FALSE(stance.has_value());
    EXPECT_EQ(stance.error().message, "stance out of range");

    // Server -> client frames are not commands
    auto const ack = Decode(net::BuildAck(MoveOutcome::Applied, 1));
    ASSERT_FALSE(ack.has_value());
    EXPECT_EQ(ack.error().message, "not a CommandMsg");
}

TEST(Codec, Rejects_Missing_Union_Values)
{
    auto const empty = Decode(MakeEmptyEnvelopeFB());
    ASSERT_FALSE(empty.has_value());
    EXPECT_EQ(empty.error().message, "missing command body");

    for (fb::Command const type : {fb::Command::Cmd_Hello, fb::Command::Cmd_Challenge, fb::Command::Cmd_Declare,
                                   fb::Command::Cmd_Switch, fb::Command::Cmd_Pick, fb::Command::Cmd_SetModifier})
    {
        auto const r = Decode(MakeBodylessCommandFB(type, 3));
        ASSERT_FALSE(r.has_value()) << static_cast<int>(type);
        EXPECT_EQ(r.error().message, "missing command body");
    }
}

TEST(Codec, Declare_Count_Left_To_Rules)
{
    auto const three = Decode(MakeRawDeclareFB(7, {0, 1, 2}, 1));
    ASSERT_TRUE(three.has_value());
    EXPECT_EQ(std::get<DeclareAction>(std::get<MatchAction>(three->body)).stances.size(), 3u);
}

TEST(Codec, BuildAction_Matches_Typed_Builders)
{
    auto const buf = net::BuildAction(5, PickAction{Stance::Tigr}, 8);
    ASSERT_TRUE(buf.has_value());
    auto const back = Decode(*buf);
    ASSERT_TRUE(back.has_value());
    EXPECT_EQ(std::get<PickAction>(std::get<MatchAction>(back->body)).stance, Stance::Tigr);

    auto const mod = net::BuildAction(5, SetModifierAction{.target = 0, .scope = ModifierScope::Round, .value = 1}, 9);
    EXPECT_FALSE(mod.has_value());
}

TEST(Codec, Snapshot_Keeps_Hidden_Fields_Hidden)
{
    std::unique_ptr<MatchImpl> m = MakeMatchInPicking({});
    ASSERT_EQ(m->Pick(Alice, Stance::Tigr), MoveOutcome::Applied);

    flatbuffers::DetachedBuffer const own = net::BuildSnapshot(*m->StatusFor(Alice), 21);
    flatbuffers::DetachedBuffer const other = net::BuildSnapshot(*m->StatusFor(Bob), 22);

    auto const own_env = net::VerifyEnvelope(AsBytes(own));
    ASSERT_TRUE(own_env.has_value());
    ASSERT_EQ((*own_env)->message_type(), fb::Message::SnapshotMsg);
    fb::StatusView const* own_view = (*own_env)->message_as_SnapshotMsg()->status();
    EXPECT_EQ((*own_env)->message_as_SnapshotMsg()->msg_id(), 21u);
    EXPECT_EQ(own_view->context(), 31u);
    EXPECT_EQ(own_view->viewer(), 0);
    EXPECT_EQ(own_view->state(), fb::MatchState::Active);
    EXPECT_EQ(own_view->phase(), fb::RoundPhase::Picking);
    EXPECT_EQ(own_view->win_threshold(), 3);
    EXPECT_EQ(own_view->config()->best_of(), 5);
    ASSERT_EQ(own_view->seats()->size(), 2u);
    EXPECT_TRUE(own_view->seats()->Get(0)->has_pick());
    EXPECT_EQ(own_view->seats()->Get(0)->picked(), fb::Stance::Tigr);
    EXPECT_EQ(own_view->seats()->Get(1)->participant(), Bob);
    ASSERT_EQ(own_view->pending()->size(), 1u);
    EXPECT_EQ(own_view->pending()->Get(0), 1);
    EXPECT_EQ(own_view->winner(), -1);

    auto const other_env = net::VerifyEnvelope(AsBytes(other));
    ASSERT_TRUE(other_env.has_value());
    fb::StatusView const* other_view = (*other_env)->message_as_SnapshotMsg()->status();
    EXPECT_EQ(other_view->viewer(), 1);
    fb::SeatView const* alice_seen = other_view->seats()->Get(0);
    EXPECT_TRUE(alice_seen->has_picked());
    EXPECT_FALSE(alice_seen->has_pick());
    // Both declared, so pairs are public
    ASSERT_EQ(alice_seen->declared()->size(), 2u);
    EXPECT_EQ(alice_seen->declared()->Get(1), std::to_underlying(fb::Stance::Tigr));
}

TEST(Codec, RoundResult_Carries_Breakdown)
{
    std::unique_ptr<MatchImpl> m = MakeMatchInPicking({6, 2, 1, 4});
    ASSERT_EQ(m->Pick(Alice, Stance::Bagr), MoveOutcome::Applied);
    ASSERT_EQ(m->Pick(Bob, Stance::Radae), MoveOutcome::RoundResolved);
    std::optional<RoundResult> const r = m->LastResult();
    ASSERT_TRUE(r.has_value());

    flatbuffers::DetachedBuffer const buf = net::BuildRoundResult(31, *r);
    auto const env = net::VerifyEnvelope(AsBytes(buf));
    ASSERT_TRUE(env.has_value());
    ASSERT_EQ((*env)->message_type(), fb::Message::RoundResultMsg);
    fb::RoundResultView const* v = (*env)->message_as_RoundResultMsg()->result();

    EXPECT_EQ(v->round(), 1);
    EXPECT_FALSE(v->tie());
    EXPECT_EQ(v->winner(), 0);
    EXPECT_EQ(v->adjacency(), fb::Adjacency::Adjacent);
    ASSERT_EQ(v->sides()->size(), 2u);

    fb::SideView const* alice = v->sides()->Get(0);
    EXPECT_EQ(alice->relationship(), fb::Relationship::Advantage);
    ASSERT_EQ(alice->roll()->dice()->size(), 2u);
    EXPECT_EQ(alice->roll()->kept(), 6);
    EXPECT_EQ(alice->roll()->discarded_index(), 1);
    EXPECT_EQ(alice->final_value(), 6);

    fb::SideView const* bob = v->sides()->Get(1);
    EXPECT_EQ(bob->relationship(), fb::Relationship::Disadvantage);
    EXPECT_EQ(bob->roll()->kept(), 1);
    EXPECT_EQ(bob->roll()->discarded_index(), 1);
    ASSERT_EQ(v->score()->size(), 2u);
    EXPECT_EQ(v->score()->Get(0), 1);
}

TEST(Codec, Violation_And_Ack)
{
    error::RuleViolation const v = error::RuleViolation{.code = error::RuleViolationCode::Pick_NotDeclared}
                                       .with_actor(1).with_stance(Stance::Darda);
    flatbuffers::DetachedBuffer const buf = net::BuildViolation(v, 44);
    auto const env = net::VerifyEnvelope(AsBytes(buf));
    ASSERT_TRUE(env.has_value());
    fb::Violation const* vio = (*env)->message_as_Violation();
    ASSERT_NE(vio, nullptr);
    EXPECT_EQ(vio->msg_id(), 44u);
    EXPECT_EQ(vio->code(), static_cast<int16_t>(error::RuleViolationCode::Pick_NotDeclared));
    EXPECT_EQ(vio->kind(), std::to_underlying(error::ErrorKind::InvalidPick));
    EXPECT_EQ(vio->text()->str(), error::describe(v));

    flatbuffers::DetachedBuffer const ack_buf = net::BuildAck(MoveOutcome::RoundTied, 45);
    auto const ack_env = net::VerifyEnvelope(AsBytes(ack_buf));
    ASSERT_TRUE(ack_env.has_value());
    fb::Ack const* ack = (*ack_env)->message_as_Ack();
    ASSERT_NE(ack, nullptr);
    EXPECT_EQ(ack->outcome(), fb::Outcome::RoundTied);
}
