#include "commands.hpp"
#include "commands_processor.hpp"
#include "seller_fixture.hpp"

#include <gtest/gtest.h>

#include <string>

TEST(Ping, Smoke) {
  // arg is ignored
  auto result = commands::Ping::parse({});
  ASSERT_TRUE(result);
  ASSERT_EQ(result->execute({}), "pong");
}

TEST(Help, Smoke) {
  // arg is ignored
  auto result = commands::Help::parse({});
  ASSERT_TRUE(result);
  auto help_str = result->execute({});
  ASSERT_EQ(help_str.find("Available commands:"), 0);
  ASSERT_NE(help_str.find("ping"), std::string::npos);
  ASSERT_NE(help_str.find("help"), std::string::npos);
  ASSERT_NE(help_str.find("sell"), std::string::npos);
  ASSERT_NE(help_str.find("list"), std::string::npos);
}

TEST(Sell, Parse) {
  auto result = commands::Sell::parse("Dune 100 40 60");
  ASSERT_TRUE(result);
  ASSERT_EQ(result->title, "Dune");
  ASSERT_EQ(result->initial_price, 100);
  ASSERT_EQ(result->floor_price, 40);
  ASSERT_EQ(result->seconds_to_deadline, 60);

  result = commands::Sell::parse("Fahrenheit 451 80 20 3600");
  ASSERT_TRUE(result);
  ASSERT_EQ(result->title, "Fahrenheit 451");
  ASSERT_EQ(result->initial_price, 80);
  ASSERT_EQ(result->floor_price, 20);
  ASSERT_EQ(result->seconds_to_deadline, 3600);

  // invalid values are still parsed, they are rejected when the listing is created
  result = commands::Sell::parse("Dune 40 100 -5");
  ASSERT_TRUE(result);
  ASSERT_EQ(result->initial_price, 40);
  ASSERT_EQ(result->floor_price, 100);
  ASSERT_EQ(result->seconds_to_deadline, -5);

  // all three numbers are mandatory
  ASSERT_FALSE(commands::Sell::parse("Dune 100 40"));
  ASSERT_FALSE(commands::Sell::parse("Dune"));
  ASSERT_FALSE(commands::Sell::parse(""));

  // title is mandatory
  ASSERT_FALSE(commands::Sell::parse("100 40 60"));

  // numbers should be numbers
  ASSERT_FALSE(commands::Sell::parse("Dune 100 forty 60"));

  // extra spaces around the title are not part of it
  result = commands::Sell::parse(" Dune  100 40 60");
  ASSERT_TRUE(result);
  ASSERT_EQ(result->title, "Dune");
  ASSERT_EQ(result->initial_price, 100);

  // and a title made of spaces is no title at all
  ASSERT_FALSE(commands::Sell::parse("   100 40 60"));
}

using CommandsProcessorTest = SellerFixture;

TEST_F(CommandsProcessorTest, sell_and_list) {
  CommandsProcessor processor(shared_state);

  ASSERT_EQ(processor.process_request("list"), "Nothing is on sale");

  auto response = processor.process_request("sell Dune 100 40 60");
  ASSERT_EQ(response, "Successfully put Dune up for sale for 100 funds, down to 40 funds in 60 second(s)");
  ASSERT_TRUE(catalogue().contains("Dune"));
  ASSERT_EQ(scheduled.size(), 1);

  response = processor.process_request("list");
  ASSERT_EQ(response.find("On sale:\n- Dune for 100 funds (floor 40) until "), 0) << response;
}

TEST_F(CommandsProcessorTest, sell_with_extra_spaces) {
  CommandsProcessor processor(shared_state);

  auto response = processor.process_request("sell Dune  100 40 60");
  ASSERT_EQ(response, "Successfully put Dune up for sale for 100 funds, down to 40 funds in 60 second(s)");
  ASSERT_TRUE(catalogue().contains("Dune"));

  // buyers reach it however they pad the title
  ASSERT_EQ(seller_service().answer_inquiry(trim(" Dune ")).performative, Performative::Propose);

  ASSERT_EQ(processor.process_request("sell   100 40 60"), "Failed to parse arguments for command 'sell'");
  ASSERT_EQ(catalogue().size(), 1);
}

TEST_F(CommandsProcessorTest, rejected_listing) {
  CommandsProcessor processor(shared_state);

  auto response = processor.process_request("sell Dune 40 100 60");
  ASSERT_EQ(response, "Failed to put Dune up for sale with error: Floor price 100 is above the initial price 40");

  response = processor.process_request("sell Dune 100 40 0");
  ASSERT_EQ(response, "Failed to put Dune up for sale with error: Deadline must be in the future");

  ASSERT_TRUE(catalogue().empty());
  ASSERT_TRUE(scheduled.empty());
}

TEST_F(CommandsProcessorTest, bad_input) {
  CommandsProcessor processor(shared_state);

  ASSERT_EQ(processor.process_request("ping\r"), "pong");
  ASSERT_EQ(processor.process_request("sell Dune"), "Failed to parse arguments for command 'sell'");
  ASSERT_EQ(processor.process_request("buy Dune").find("Failed to execute unknown command 'buy'. Available commands:"),
            0);
}
