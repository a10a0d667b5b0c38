/*
 * Copyright (c) 2015 Cryptonomex, Inc., and contributors.
 *
 * The MIT License
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in
 * all copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN
 * THE SOFTWARE.
 */
#include <boost/test/unit_test.hpp>

#include <atomicswap/chain/swap_engine.hpp>
#include <atomicswap/protocol/exceptions.hpp>

#include "../common/swap_fixture.hpp"

#include <type_traits>

using namespace atomicswap::chain;
using namespace atomicswap::chain::test;
using namespace atomicswap::protocol;

BOOST_FIXTURE_TEST_SUITE( swap_tests, swap_fixture )

BOOST_AUTO_TEST_CASE( initiate_stores_swap )
{ try {
   ACTORS( (alice)(bob) );

   const swap_id_type id = initiate( alice_id, bob_id, 100, 200 );

   optional<swap_object> swap = engine.get_swap( id );
   BOOST_REQUIRE( swap.valid() );
   BOOST_CHECK( swap->initiator == alice_id );
   BOOST_CHECK( swap->counterparty == bob_id );
   BOOST_CHECK_EQUAL( swap->initiator_asset.value, 100 );
   BOOST_CHECK_EQUAL( swap->counterparty_asset.value, 200 );

   // the deposit sits in escrow
   BOOST_CHECK_EQUAL( get_balance( alice_id ).value, INITIAL_ACTOR_BALANCE - 100 );
   BOOST_CHECK_EQUAL( escrow_balance().value, 100 );
   BOOST_CHECK_EQUAL( engine.get_swap_count(), 1u );
   BOOST_CHECK( !engine.is_guard_active() );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( initiate_ids_strictly_increase )
{ try {
   ACTORS( (alice)(bob)(charlie) );

   const swap_id_type first = initiate( alice_id, bob_id, 10, 10 );
   const swap_id_type second = initiate( bob_id, charlie_id, 10, 10 );
   cancel( alice_id, first );
   const swap_id_type third = initiate( alice_id, charlie_id, 10, 10 );

   BOOST_CHECK_LT( first, second );
   BOOST_CHECK_LT( second, third );
   BOOST_CHECK( !engine.get_swap( first ).valid() );
   BOOST_CHECK( engine.get_swap( second ).valid() );
   BOOST_CHECK( engine.get_swap( third ).valid() );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( initiate_rejects_invalid_terms )
{ try {
   ACTORS( (alice)(bob) );

   ATOMICSWAP_CHECK_THROW( initiate( alice_id, bob_id, 0, 50 ), swap_invalid_amount );
   ATOMICSWAP_CHECK_THROW( initiate( alice_id, bob_id, 100, 0 ), swap_invalid_amount );
   ATOMICSWAP_CHECK_THROW( initiate( alice_id, bob_id, 100, -3 ), swap_invalid_amount );
   ATOMICSWAP_CHECK_THROW( initiate( alice_id, alice_id, 100, 50 ), swap_self_swap_not_allowed );

   BOOST_CHECK_EQUAL( engine.get_swap_count(), 0u );
   BOOST_CHECK( !engine.get_swap( 0 ).valid() );
   BOOST_CHECK_EQUAL( get_balance( alice_id ).value, INITIAL_ACTOR_BALANCE );
   BOOST_CHECK_EQUAL( escrow_balance().value, 0 );
   BOOST_CHECK_EQUAL( ledger.transfer_count, 0u );
   BOOST_CHECK_EQUAL( events.size(), 0u );
   BOOST_CHECK( !engine.is_guard_active() );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( initiate_fails_when_deposit_fails )
{ try {
   ACTORS( (alice)(bob) );

   ATOMICSWAP_CHECK_THROW( initiate( alice_id, bob_id, INITIAL_ACTOR_BALANCE + 1, 50 ), swap_deposit_failed );

   BOOST_CHECK_EQUAL( engine.get_swap_count(), 0u );
   BOOST_CHECK_EQUAL( get_balance( alice_id ).value, INITIAL_ACTOR_BALANCE );
   BOOST_CHECK_EQUAL( escrow_balance().value, 0 );

   // the failed attempt did not consume an id
   const swap_id_type id = initiate( alice_id, bob_id, 10, 50 );
   BOOST_CHECK_EQUAL( id, 0u );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( accept_exchanges_deposits )
{ try {
   ACTORS( (alice)(bob) );

   BOOST_TEST_MESSAGE( "alice escrows 100 and asks bob for 50" );
   const swap_id_type id = initiate( alice_id, bob_id, 100, 50 );

   optional<swap_object> swap = engine.get_swap( id );
   BOOST_REQUIRE( swap.valid() );
   BOOST_CHECK( swap->initiator == alice_id );
   BOOST_CHECK( swap->counterparty == bob_id );
   BOOST_CHECK_EQUAL( swap->initiator_asset.value, 100 );
   BOOST_CHECK_EQUAL( swap->counterparty_asset.value, 50 );

   const share_type alice_before = get_balance( alice_id );
   const share_type bob_before = get_balance( bob_id );

   BOOST_TEST_MESSAGE( "bob accepts with 50 attached" );
   accept( bob_id, id, 50 );

   BOOST_CHECK_EQUAL( ( get_balance( alice_id ) - alice_before ).value, 50 );
   BOOST_CHECK_EQUAL( ( get_balance( bob_id ) - bob_before ).value, 100 - 50 );
   BOOST_CHECK_EQUAL( escrow_balance().value, 0 );
   BOOST_CHECK( !engine.get_swap( id ).valid() );
   BOOST_CHECK_EQUAL( engine.get_swap_count(), 0u );
   BOOST_CHECK( !engine.is_guard_active() );
   BOOST_CHECK_EQUAL( ledger.total_supply().value, 2 * INITIAL_ACTOR_BALANCE );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( accept_rejects_wrong_caller )
{ try {
   ACTORS( (alice)(bob)(charlie) );

   const swap_id_type id = initiate( alice_id, bob_id, 100, 200 );

   ATOMICSWAP_CHECK_THROW( accept( charlie_id, id, 200 ), swap_unauthorized );
   ATOMICSWAP_CHECK_THROW( accept( alice_id, id, 200 ), swap_unauthorized );

   optional<swap_object> swap = engine.get_swap( id );
   BOOST_REQUIRE( swap.valid() );
   BOOST_CHECK( swap->counterparty == bob_id );
   BOOST_CHECK_EQUAL( swap->initiator_asset.value, 100 );
   BOOST_CHECK_EQUAL( get_balance( charlie_id ).value, INITIAL_ACTOR_BALANCE );
   BOOST_CHECK( !engine.is_guard_active() );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( accept_rejects_wrong_amount )
{ try {
   ACTORS( (alice)(bob) );

   const swap_id_type id = initiate( alice_id, bob_id, 100, 200 );

   ATOMICSWAP_CHECK_THROW( accept( bob_id, id, 150 ), swap_invalid_amount );
   ATOMICSWAP_CHECK_THROW( accept( bob_id, id, 250 ), swap_invalid_amount );
   ATOMICSWAP_CHECK_THROW( accept( bob_id, id, 0 ), swap_invalid_amount );

   BOOST_CHECK( engine.get_swap( id ).valid() );
   BOOST_CHECK_EQUAL( get_balance( bob_id ).value, INITIAL_ACTOR_BALANCE );

   accept( bob_id, id, 200 );
   BOOST_CHECK( !engine.get_swap( id ).valid() );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( accept_unknown_swap )
{ try {
   ACTORS( (alice)(bob) );

   ATOMICSWAP_CHECK_THROW( accept( bob_id, 0, 50 ), swap_not_found );
   ATOMICSWAP_CHECK_THROW( accept( bob_id, 999, 50 ), swap_not_found );
   BOOST_CHECK( !engine.is_guard_active() );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( resolved_swap_is_not_found )
{ try {
   ACTORS( (alice)(bob) );

   const swap_id_type accepted = initiate( alice_id, bob_id, 100, 200 );
   accept( bob_id, accepted, 200 );
   ATOMICSWAP_CHECK_THROW( accept( bob_id, accepted, 200 ), swap_not_found );
   ATOMICSWAP_CHECK_THROW( cancel( alice_id, accepted ), swap_not_found );

   const swap_id_type cancelled = initiate( alice_id, bob_id, 100, 200 );
   cancel( alice_id, cancelled );
   ATOMICSWAP_CHECK_THROW( cancel( alice_id, cancelled ), swap_not_found );
   ATOMICSWAP_CHECK_THROW( accept( bob_id, cancelled, 200 ), swap_not_found );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( accept_fails_without_counterparty_funds )
{ try {
   ACTORS( (alice)(bob) );

   const swap_id_type id = initiate( alice_id, bob_id, 100, INITIAL_ACTOR_BALANCE + 1 );
   ATOMICSWAP_CHECK_THROW( accept( bob_id, id, INITIAL_ACTOR_BALANCE + 1 ), swap_transfer_failed );

   BOOST_CHECK( engine.get_swap( id ).valid() );
   BOOST_CHECK_EQUAL( get_balance( alice_id ).value, INITIAL_ACTOR_BALANCE - 100 );
   BOOST_CHECK_EQUAL( get_balance( bob_id ).value, INITIAL_ACTOR_BALANCE );
   BOOST_CHECK_EQUAL( escrow_balance().value, 100 );
   BOOST_CHECK( !engine.is_guard_active() );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( cancel_refunds_initiator )
{ try {
   ACTORS( (alice)(bob) );

   const swap_id_type id = initiate( alice_id, bob_id, 100, 200 );
   BOOST_CHECK_EQUAL( get_balance( alice_id ).value, INITIAL_ACTOR_BALANCE - 100 );

   cancel( alice_id, id );

   BOOST_CHECK_EQUAL( get_balance( alice_id ).value, INITIAL_ACTOR_BALANCE );
   BOOST_CHECK_EQUAL( get_balance( bob_id ).value, INITIAL_ACTOR_BALANCE );
   BOOST_CHECK_EQUAL( escrow_balance().value, 0 );
   BOOST_CHECK( !engine.get_swap( id ).valid() );
   BOOST_CHECK( !engine.is_guard_active() );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( cancel_rejects_non_initiator )
{ try {
   ACTORS( (alice)(bob)(charlie) );

   const swap_id_type id = initiate( alice_id, bob_id, 100, 200 );

   ATOMICSWAP_CHECK_THROW( cancel( bob_id, id ), swap_unauthorized );
   ATOMICSWAP_CHECK_THROW( cancel( charlie_id, id ), swap_unauthorized );
   ATOMICSWAP_CHECK_THROW( cancel( alice_id, id + 1 ), swap_not_found );

   BOOST_CHECK( engine.get_swap( id ).valid() );
   BOOST_CHECK_EQUAL( escrow_balance().value, 100 );
   BOOST_CHECK( !engine.is_guard_active() );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( cancel_fails_when_refund_fails )
{ try {
   ACTORS( (alice)(bob) );

   const swap_id_type id = initiate( alice_id, bob_id, 100, 200 );
   ledger.fail_transfer = [this]( account_id_type from, account_id_type, share_type ) {
      return from == engine.escrow_account();
   };

   ATOMICSWAP_CHECK_THROW( cancel( alice_id, id ), swap_refund_failed );
   BOOST_CHECK( engine.get_swap( id ).valid() );
   BOOST_CHECK_EQUAL( escrow_balance().value, 100 );
   BOOST_CHECK( !engine.is_guard_active() );

   ledger.fail_transfer = nullptr;
   cancel( alice_id, id );
   BOOST_CHECK_EQUAL( get_balance( alice_id ).value, INITIAL_ACTOR_BALANCE );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( swaps_are_independent )
{ try {
   ACTORS( (alice)(bob)(charlie) );

   const swap_id_type ab = initiate( alice_id, bob_id, 100, 10 );
   const swap_id_type ac = initiate( alice_id, charlie_id, 200, 20 );
   const swap_id_type cb = initiate( charlie_id, bob_id, 30, 300 );
   BOOST_CHECK_EQUAL( escrow_balance().value, 330 );

   accept( charlie_id, ac, 20 );
   cancel( charlie_id, cb );

   BOOST_CHECK( engine.get_swap( ab ).valid() );
   BOOST_CHECK( !engine.get_swap( ac ).valid() );
   BOOST_CHECK( !engine.get_swap( cb ).valid() );
   BOOST_CHECK_EQUAL( escrow_balance().value, 100 );

   BOOST_CHECK_EQUAL( get_balance( alice_id ).value, INITIAL_ACTOR_BALANCE - 300 + 20 );
   BOOST_CHECK_EQUAL( get_balance( charlie_id ).value, INITIAL_ACTOR_BALANCE + 200 - 20 );
   BOOST_CHECK_EQUAL( ledger.total_supply().value, 3 * INITIAL_ACTOR_BALANCE );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( list_swaps_by_account )
{ try {
   ACTORS( (alice)(bob)(charlie) );

   const swap_id_type s0 = initiate( alice_id, bob_id, 10, 10 );
   const swap_id_type s1 = initiate( charlie_id, bob_id, 10, 10 );
   const swap_id_type s2 = initiate( alice_id, charlie_id, 10, 10 );

   auto from_alice = engine.get_swaps_by_initiator( alice_id, 0, 10 );
   BOOST_REQUIRE_EQUAL( from_alice.size(), 2u );
   BOOST_CHECK_EQUAL( from_alice[0].id, s0 );
   BOOST_CHECK_EQUAL( from_alice[1].id, s2 );

   auto to_bob = engine.get_swaps_by_counterparty( bob_id, s1, 10 );
   BOOST_REQUIRE_EQUAL( to_bob.size(), 1u );
   BOOST_CHECK_EQUAL( to_bob[0].id, s1 );

   accept( bob_id, s0, 10 );
   BOOST_CHECK_EQUAL( engine.get_swaps_by_initiator( alice_id, 0, 10 ).size(), 1u );

   BOOST_CHECK_THROW( engine.get_swaps_by_initiator( alice_id, 0, ATOMICSWAP_DEFAULT_API_LIMIT + 1 ), fc::exception );
   BOOST_CHECK_THROW( engine.get_swaps_by_counterparty( bob_id, 0, ATOMICSWAP_DEFAULT_API_LIMIT + 1 ), fc::exception );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( events_follow_lifecycle )
{ try {
   ACTORS( (alice)(bob) );

   const swap_id_type accepted = initiate( alice_id, bob_id, 100, 50 );
   accept( bob_id, accepted, 50 );
   const swap_id_type cancelled = initiate( alice_id, bob_id, 70, 30 );
   cancel( alice_id, cancelled );

   // failed calls publish nothing
   ATOMICSWAP_CHECK_THROW( cancel( alice_id, cancelled ), swap_not_found );

   auto all = events.get_events( 0, 100 );
   BOOST_REQUIRE_EQUAL( all.size(), 4u );

   BOOST_REQUIRE( all[0].event.is_type<swap_initiated_operation>() );
   const auto& initiated = all[0].event.get<swap_initiated_operation>();
   BOOST_CHECK_EQUAL( initiated.swap_id, accepted );
   BOOST_CHECK( initiated.initiator == alice_id );
   BOOST_CHECK( initiated.counterparty == bob_id );
   BOOST_CHECK_EQUAL( initiated.initiator_asset.value, 100 );
   BOOST_CHECK_EQUAL( initiated.counterparty_asset.value, 50 );

   BOOST_REQUIRE( all[1].event.is_type<swap_accepted_operation>() );
   const auto& acc = all[1].event.get<swap_accepted_operation>();
   BOOST_CHECK_EQUAL( acc.swap_id, accepted );
   BOOST_CHECK( acc.initiator == alice_id );
   BOOST_CHECK( acc.counterparty == bob_id );

   BOOST_CHECK( all[2].event.is_type<swap_initiated_operation>() );
   BOOST_REQUIRE( all[3].event.is_type<swap_cancelled_operation>() );
   const auto& can = all[3].event.get<swap_cancelled_operation>();
   BOOST_CHECK_EQUAL( can.swap_id, cancelled );
   BOOST_CHECK( can.initiator == alice_id );

   BOOST_CHECK_EQUAL( events.get_events_for_swap( cancelled ).size(), 2u );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( event_listener_runs_after_guard_release )
{ try {
   ACTORS( (alice)(bob) );

   bool guard_seen = true;
   auto conn = engine.applied_event.connect( [&]( const swap_event& ) {
      guard_seen = engine.is_guard_active();
   });
   initiate( alice_id, bob_id, 10, 10 );
   conn.disconnect();

   BOOST_CHECK( !guard_seen );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( failing_listener_does_not_undo_swap )
{ try {
   ACTORS( (alice)(bob) );

   auto conn = engine.applied_event.connect( []( const swap_event& ) {
      FC_THROW( "listener failure" );
   });
   const swap_id_type id = initiate( alice_id, bob_id, 10, 10 );
   conn.disconnect();

   BOOST_CHECK( engine.get_swap( id ).valid() );
   BOOST_CHECK_EQUAL( events.size(), 1u );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( event_log_subscription_ends_with_log )
{ try {
   ACTORS( (alice)(bob) );

   BOOST_CHECK( !std::is_copy_constructible<swap_event_log>::value );
   BOOST_CHECK( !std::is_copy_assignable<swap_event_log>::value );

   {
      swap_event_log scoped_log( 0 );
      scoped_log.attach( engine );
      initiate( alice_id, bob_id, 10, 10 );
      BOOST_CHECK_EQUAL( scoped_log.size(), 1u );
   }
   // the destroyed log is no longer called and the fixture's log keeps recording
   initiate( alice_id, bob_id, 20, 20 );
   BOOST_CHECK_EQUAL( events.size(), 2u );

   swap_event_log detached_log( 0 );
   detached_log.attach( engine );
   detached_log.detach();
   initiate( alice_id, bob_id, 30, 30 );
   BOOST_CHECK_EQUAL( detached_log.size(), 0u );
   BOOST_CHECK_EQUAL( events.size(), 3u );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_SUITE_END()
